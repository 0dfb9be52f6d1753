#ifndef TOKENFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
#define TOKENFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H

#include <filesystem> // inja set_include_callback
#include <string>
#include <string_view>
#include <inja/inja.hpp>
#include <nlohmann/json.hpp>

namespace tokenflow {

// inja 环境，禁用 include。渲染错误抛 std::runtime_error
class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    std::string render(std::string_view template_str, const nlohmann::json& data);

    // Renders `{{ <expression> }}` and reads the result as a boolean:
    // "true" / non-zero numbers / non-empty strings other than "false", "0", "null".
    bool evaluate_condition(const std::string& expression, const nlohmann::json& data);

    // Process-wide instance; inja::Environment is not thread-safe, calls are serialised
    static std::string render_shared(std::string_view template_str, const nlohmann::json& data);
    static bool evaluate_shared(const std::string& expression, const nlohmann::json& data);

private:
    inja::Environment env_;
    void configure_security();
};

} // namespace tokenflow

#endif // TOKENFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
