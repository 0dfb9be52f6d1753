#include "common/utils/template_renderer.h"
#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>

namespace tokenflow {

namespace {

std::mutex g_shared_mutex;

InjaTemplateRenderer& shared_renderer() {
    static InjaTemplateRenderer renderer;
    return renderer;
}

std::string trim_lower(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

InjaTemplateRenderer::InjaTemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_line_statement("##");

    configure_security();
}

void InjaTemplateRenderer::configure_security() {
    env_.set_search_included_templates_in_files(false);
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled for security.", inja::SourceLocation{});
    });
}

std::string InjaTemplateRenderer::render(std::string_view template_str, const nlohmann::json& data) {
    try {
        return env_.render(template_str, data);
    } catch (const inja::InjaError& e) {
        throw std::runtime_error("Template render error: " + std::string(e.message));
    }
}

bool InjaTemplateRenderer::evaluate_condition(const std::string& expression, const nlohmann::json& data) {
    const std::string text = trim_lower(render("{{ " + expression + " }}", data));
    if (text.empty() || text == "false" || text == "0" || text == "null" || text == "0.0") return false;
    return true;
}

std::string InjaTemplateRenderer::render_shared(std::string_view template_str, const nlohmann::json& data) {
    std::lock_guard<std::mutex> lock(g_shared_mutex);
    return shared_renderer().render(template_str, data);
}

bool InjaTemplateRenderer::evaluate_shared(const std::string& expression, const nlohmann::json& data) {
    std::lock_guard<std::mutex> lock(g_shared_mutex);
    return shared_renderer().evaluate_condition(expression, data);
}

} // namespace tokenflow
