#include "renderer.hpp"

namespace tilepool {

construction_failure::construction_failure(const std::string &what)
  : std::runtime_error(what) {
}

render_failure::render_failure(const std::string &what)
  : std::runtime_error(what) {
}

renderer::~renderer() {
}

renderer_factory::~renderer_factory() {
}

} // namespace tilepool
