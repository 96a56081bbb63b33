/**
 * SHOTGATE - Signed Screenshot Gateway
 * Render payload builder
 */

#include "render/renderer.hpp"

namespace shotgate::render {

nlohmann::json build_render_payload(const auth::RequestDescriptor& descriptor,
                                    std::chrono::milliseconds navigation_timeout)
{
    nlohmann::json screenshot_options{{"type", "png"}};
    if (descriptor.full_page()) {
        screenshot_options["fullPage"] = true;
    }

    nlohmann::json payload{
        {"url", descriptor.target_url},
        {"screenshotOptions", screenshot_options},
        {"viewport", {
            {"width", descriptor.width},
            {"height", descriptor.height.value_or(kFullPageViewportHeight)}
        }},
        {"gotoOptions", {
            {"waitUntil", "networkidle0"},
            {"timeout", navigation_timeout.count()}
        }}
    };

    if (!descriptor.injected_js.empty()) {
        payload["addScriptTag"] = nlohmann::json::array({{{"content", descriptor.injected_js}}});
    }
    if (!descriptor.injected_css.empty()) {
        payload["addStyleTag"] = nlohmann::json::array({{{"content", descriptor.injected_css}}});
    }

    return payload;
}

} // namespace shotgate::render
