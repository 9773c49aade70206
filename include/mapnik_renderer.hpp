#ifndef TILEPOOL_MAPNIK_RENDERER_HPP
#define TILEPOOL_MAPNIK_RENDERER_HPP

#include "renderer.hpp"

#include <string>

namespace tilepool {

struct mapnik_renderer_options {
  mapnik_renderer_options();

  // size of the output image in pixels.
  unsigned int width, height;
  // any format string mapnik understands, e.g: "png", "png8", "jpeg80".
  std::string image_format;
  double scale_factor;
  // directory relative paths in the map XML are resolved against.
  std::string base_path;
  // whether to fail on unknown XML elements and attributes.
  bool strict;
};

/* Builds renderers from mapnik XML map definitions, passed in as the
 * key. Rather than attempt to share the mapnik::Map, with all of its
 * datasources and caches, between threads, each key gets its own Map
 * which lives on its worker's thread.
 *
 * global_cleanup() clears the marker and memory-mapped file caches,
 * which are process-wide singletons used by every Map.
 */
struct mapnik_renderer_factory : public renderer_factory {
  explicit mapnik_renderer_factory(const mapnik_renderer_options &options);
  virtual ~mapnik_renderer_factory();

  virtual std::unique_ptr<renderer> construct(const std::string &key);
  virtual void global_cleanup();

private:
  mapnik_renderer_options m_options;
};

// register fonts and input plugins with mapnik. this has to happen
// once, before any map is loaded.
void register_mapnik_plugins(const std::string &fonts_dir, const std::string &input_plugins_dir);

// MIME type for a mapnik image format string.
std::string content_type(const std::string &image_format);

} // namespace tilepool

#endif // TILEPOOL_MAPNIK_RENDERER_HPP
