#include "mapnik_renderer.hpp"
#include "logging/logger.hpp"

#include <boost/format.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <mapnik/map.hpp>
#include <mapnik/box2d.hpp>
#include <mapnik/image.hpp>
#include <mapnik/image_util.hpp>
#include <mapnik/agg_renderer.hpp>
#include <mapnik/load_map.hpp>
#include <mapnik/marker_cache.hpp>
#include <mapnik/mapped_memory_cache.hpp>
#include <mapnik/datasource_cache.hpp>
#include <mapnik/font_engine_freetype.hpp>

namespace tilepool {

namespace {

class mapnik_renderer : public renderer {
public:
  mapnik_renderer(const std::string &xml, const mapnik_renderer_options &options);
  virtual ~mapnik_renderer();

  virtual std::string render(const extent &bbox);

private:
  mapnik::Map m_map;
  mapnik_renderer_options m_options;
};

mapnik_renderer::mapnik_renderer(const std::string &xml, const mapnik_renderer_options &options)
  : m_map(options.width, options.height),
    m_options(options) {

  try {
    mapnik::load_map_string(m_map, xml, options.strict, options.base_path);

  } catch (const std::exception &e) {
    throw construction_failure((boost::format("Unable to load map: %1%") % e.what()).str());
  }
}

mapnik_renderer::~mapnik_renderer() {
}

std::string mapnik_renderer::render(const extent &bbox) {
  try {
    m_map.zoom_to_box(mapnik::box2d<double>(bbox.minx, bbox.miny, bbox.maxx, bbox.maxy));

    mapnik::image_rgba8 image(m_map.width(), m_map.height());
    mapnik::agg_renderer<mapnik::image_rgba8> ren(m_map, image, m_options.scale_factor);
    ren.apply();

    return mapnik::save_to_string(image, m_options.image_format);

  } catch (const std::exception &e) {
    throw render_failure(e.what());
  }
}

} // anonymous namespace

mapnik_renderer_options::mapnik_renderer_options()
  : width(256), height(256),
    image_format("png"),
    scale_factor(1.0),
    base_path(),
    strict(false) {
}

mapnik_renderer_factory::mapnik_renderer_factory(const mapnik_renderer_options &options)
  : m_options(options) {
}

mapnik_renderer_factory::~mapnik_renderer_factory() {
}

std::unique_ptr<renderer> mapnik_renderer_factory::construct(const std::string &key) {
  return std::unique_ptr<renderer>(new mapnik_renderer(key, m_options));
}

void mapnik_renderer_factory::global_cleanup() {
  mapnik::marker_cache::instance().clear();
  mapnik::mapped_memory_cache::instance().clear();
}

void register_mapnik_plugins(const std::string &fonts_dir, const std::string &input_plugins_dir) {
  if (!mapnik::freetype_engine::register_fonts(fonts_dir)) {
    LOG_WARNING(boost::format("No fonts were registered from %1%") % fonts_dir);
  }
  if (!mapnik::datasource_cache::instance().register_datasources(input_plugins_dir)) {
    LOG_WARNING(boost::format("No input plugins were registered from %1%") % input_plugins_dir);
  }
}

std::string content_type(const std::string &image_format) {
  namespace bal = boost::algorithm;

  if (bal::starts_with(image_format, "png")) {
    return "image/png";

  } else if (bal::starts_with(image_format, "jpeg") || bal::starts_with(image_format, "jpg")) {
    return "image/jpeg";

  } else if (bal::starts_with(image_format, "webp")) {
    return "image/webp";

  } else if (bal::starts_with(image_format, "tif")) {
    return "image/tiff";
  }

  return "application/octet-stream";
}

} // namespace tilepool
