#include <boost/program_options.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/exceptions.hpp>
#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include <chrono>
#include <fstream>
#include <sstream>
#include <iostream>

#include "tile.hpp"
#include "parse_tile.hpp"
#include "render_pool.hpp"
#include "mapnik_renderer.hpp"
#include "logging/logger.hpp"
#include "config.h"

namespace bpo = boost::program_options;
namespace pt = boost::property_tree;
namespace fs = boost::filesystem;

namespace {

std::string read_file(const std::string &file_name) {
  std::ifstream in(file_name.c_str(), std::ios::in | std::ios::binary);
  if (!in) {
    throw std::runtime_error((boost::format("Unable to open \"%1%\" for reading.") % file_name).str());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

// file extension for a mapnik image format, e.g: "png8:z=1" -> "png".
std::string extension_for(const std::string &image_format) {
  const std::string type = tilepool::content_type(image_format);
  if (type == "image/png")  { return "png"; }
  if (type == "image/jpeg") { return "jpg"; }
  if (type == "image/webp") { return "webp"; }
  if (type == "image/tiff") { return "tif"; }
  return "bin";
}

} // anonymous namespace

int main(int argc, char *argv[]) {
  tilepool::pool_options pool_opts;
  tilepool::mapnik_renderer_options map_opts;
  std::string map_file, tile_str, output_dir, fonts_dir, input_plugins_dir, config_file, log_level;
  unsigned int max_zoom = 0;
  double lon = 0.0, lat = 0.0;
  unsigned int zoom = 0;

  bpo::options_description options(
    "tilepool " VERSION "\n"
    "\n"
    "  Usage: tilepool_render [options] <map-file> [<z/x/y>]\n"
    "\n"
    "Renders a tile from a Mapnik XML map file, optionally together with all of "
    "its descendants down to --max-zoom, writing each one to "
    "<output-dir>/$z/$x/$y.$ext. The tile may be given either as a z/x/y path or "
    "with --lon, --lat and --zoom."
    "\n"
    "\n");

  options.add_options()
    ("help,h", "Print this help message.")
    ("lon", bpo::value<double>(&lon), "Longitude of a point in the tile, in degrees.")
    ("lat", bpo::value<double>(&lat), "Latitude of a point in the tile, in degrees.")
    ("zoom,z", bpo::value<unsigned int>(&zoom), "Zoom level, used with --lon and --lat.")
    ("max-zoom", bpo::value<unsigned int>(&max_zoom),
     "Also render all descendants of the tile down to this zoom level.")
    ("output-dir,o", bpo::value<std::string>(&output_dir)->default_value("."),
     "Directory to write tiles into.")
    ("width", bpo::value<unsigned int>(&map_opts.width)->default_value(256),
     "Width of the rendered image in pixels.")
    ("height", bpo::value<unsigned int>(&map_opts.height)->default_value(256),
     "Height of the rendered image in pixels.")
    ("image-format,f", bpo::value<std::string>(&map_opts.image_format)->default_value("png"),
     "Mapnik image format for the output, e.g: png, png8, jpeg80.")
    ("scale-factor,s", bpo::value<double>(&map_opts.scale_factor)->default_value(1.0),
     "Scale factor to multiply style values by.")
    ("threads", bpo::value<std::size_t>(),
     "Number of worker threads, which bounds the number of map files loaded at once.")
    ("idle-timeout", bpo::value<double>(),
     "Seconds a loaded map may sit unused before it is released.")
    ("fonts", bpo::value<std::string>(&fonts_dir)->default_value(MAPNIK_DEFAULT_FONT_DIR),
     "Directory to tell Mapnik to look in for fonts.")
    ("input-plugins", bpo::value<std::string>(&input_plugins_dir)
     ->default_value(MAPNIK_DEFAULT_INPUT_PLUGIN_DIR),
     "Directory to tell Mapnik to look in for input plugins.")
    ("config-file,c", bpo::value<std::string>(&config_file),
     "JSON config file with pool settings. Command line options take precedence.")
    ("log-level", bpo::value<std::string>(&log_level),
     "One of trace, debug, info, warning, error or fatal. Defaults to info.")
    // positional arguments
    ("map-file", bpo::value<std::string>(&map_file), "Mapnik XML input file.")
    ("tile", bpo::value<std::string>(&tile_str), "Tile to render, as z/x/y.")
    ;

  bpo::positional_options_description pos_options;
  pos_options
    .add("map-file", 1)
    .add("tile", 1)
    ;

  bpo::variables_map vm;

  try {
    bpo::store(bpo::command_line_parser(argc,argv)
           .options(options)
           .positional(pos_options)
           .run(),
           vm);
    bpo::notify(vm);

  } catch (std::exception &e) {
    std::cerr << "Unable to parse command line options because: " << e.what() << "\n"
              << "This is a bug, please report it at " PACKAGE_BUGREPORT << "\n";
    return EXIT_FAILURE;
  }

  if (vm.count("help")) {
    std::cout << options << "\n";
    return EXIT_SUCCESS;
  }

  if (vm.count("map-file") == 0) {
    std::cerr << "The <map-file> argument was not provided, but is mandatory\n\n";
    std::cerr << options << "\n";
    return EXIT_FAILURE;
  }

  tilepool::tile root;
  if (vm.count("tile")) {
    if (!tilepool::parse_tile(tile_str, root)) {
      std::cerr << "The string \"" << tile_str << "\" is not a valid z/x/y tile.\n";
      return EXIT_FAILURE;
    }

  } else if (vm.count("lon") && vm.count("lat") && vm.count("zoom")) {
    if (zoom > 30) {
      std::cerr << "Zoom level " << zoom << " is too deep, the maximum is 30.\n";
      return EXIT_FAILURE;
    }
    root = tilepool::tile::from_coordinates(lon, lat, zoom);

  } else {
    std::cerr << "Either a <z/x/y> tile or all of --lon, --lat and --zoom must be given.\n\n";
    std::cerr << options << "\n";
    return EXIT_FAILURE;
  }

  if (vm.count("max-zoom") == 0) {
    max_zoom = root.z;

  } else if ((max_zoom < root.z) || (max_zoom > 30)) {
    std::cerr << "--max-zoom must be between the tile's zoom (" << root.z << ") and 30.\n";
    return EXIT_FAILURE;
  }

  try {
    tilepool::logging::set_level(tilepool::logging::severity::info);

    if (vm.count("config-file")) {
      pt::ptree config;
      pt::read_json(config_file, config);

      pool_opts = tilepool::load_pool_options(config);
      boost::optional<std::string> level = config.get_optional<std::string>("log-level");
      if (level) {
        tilepool::logging::set_level(tilepool::logging::severity_from_string(*level));
      }
    }

    if (vm.count("threads")) {
      pool_opts.threads = vm["threads"].as<std::size_t>();
    }
    if (vm.count("idle-timeout")) {
      const double seconds = vm["idle-timeout"].as<double>();
      if (seconds < 0.0) {
        throw std::runtime_error("--idle-timeout must not be negative.");
      }
      pool_opts.idle_timeout = std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
    }
    if (vm.count("log-level")) {
      tilepool::logging::set_level(tilepool::logging::severity_from_string(log_level));
    }

  } catch (pt::ptree_error const& e) {
    std::cerr << "Error while parsing config: " << config_file << std::endl;
    std::cerr << e.what() << std::endl;
    return EXIT_FAILURE;

  } catch (std::exception const& e) {
    std::cerr << "Error while loading config: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  int tiles_failed = 0;

  try {
    tilepool::register_mapnik_plugins(fonts_dir, input_plugins_dir);

    // the whole map definition is the key, so that two different
    // files with the same contents share a renderer.
    const std::string key = read_file(map_file);
    map_opts.base_path = fs::absolute(fs::path(map_file)).parent_path().string();

    std::shared_ptr<tilepool::renderer_factory> factory =
      std::make_shared<tilepool::mapnik_renderer_factory>(map_opts);
    tilepool::render_pool pool(factory, pool_opts);

    const std::string ext = extension_for(map_opts.image_format);

    for (const tilepool::tile &t : root.children(max_zoom)) {
      const tilepool::extent bbox = tilepool::bounding_box(t);
      tilepool::render_response response = pool.acquire_or_create(key).render(bbox);

      // the worker may have idled out between acquiring the channel
      // and rendering, in which case a fresh one is needed.
      if (response.is_right() &&
          (response.right().status == tilepool::render_status::worker_unavailable)) {
        response = pool.acquire_or_create(key).render(bbox);
      }

      if (response.is_right()) {
        LOG_ERROR(boost::format("Unable to render tile %1%: %2%") % t % response.right());
        ++tiles_failed;
        continue;
      }

      fs::path dir = fs::path(output_dir) / (boost::format("%1%") % t.z).str()
        / (boost::format("%1%") % t.x).str();
      fs::create_directories(dir);
      fs::path file = dir / (boost::format("%1%.%2%") % t.y % ext).str();

      std::ofstream out(file.string().c_str(), std::ios::out | std::ios::binary);
      const std::string &bytes = response.left();
      out.write(bytes.data(), bytes.size());
      if (!out) {
        throw std::runtime_error((boost::format("Unable to write %1%.") % file).str());
      }

      LOG_INFO(boost::format("Wrote %1% (%2%, %3% bytes)")
               % file.string() % tilepool::content_type(map_opts.image_format) % bytes.size());
    }

  } catch (std::exception& e) {
    std::cerr << "Exception: " << e.what() << "\n";
    return EXIT_FAILURE;
  }

  return (tiles_failed > 0) ? EXIT_FAILURE : EXIT_SUCCESS;
}
