#include "tool_handlers/tool_handlers.hpp"

namespace tool_handlers {

void register_all_tools() {
    general_handlers::register_tools();
    project_handlers::register_tools();
    timeline_handlers::register_tools();
    media_handlers::register_tools();
    color_handlers::register_tools();
    render_handlers::register_tools();
}

} // namespace tool_handlers
