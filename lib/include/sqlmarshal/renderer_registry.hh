#pragma once

#include <sqlmarshal/base_renderer.hh>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlmarshal::codegen {

class RendererPlugin;

// ============================================================================
// Renderer Registry
// ============================================================================

/**
 * Singleton registry of target-language renderers.
 *
 * Renderers arrive through plugins that register themselves during static
 * initialization (see renderer_plugin.hh). Lookup is case-insensitive.
 *
 * \code
 *   auto& registry = RendererRegistry::instance();
 *   if (auto* renderer = registry.get_renderer("csharp")) {
 *       auto files = renderer->generate_files(analyzed, out_dir);
 *   }
 * \endcode
 */
class RendererRegistry {
public:
    static RendererRegistry& instance();

    RendererRegistry(const RendererRegistry&) = delete;
    RendererRegistry(RendererRegistry&&) = delete;
    RendererRegistry& operator=(const RendererRegistry&) = delete;
    RendererRegistry& operator=(RendererRegistry&&) = delete;

    /// Register (or replace) the renderer for a language
    void register_renderer(const std::string& language_name,
                           std::unique_ptr<BaseRenderer> renderer);

    /// Renderer for a language, or nullptr
    BaseRenderer* get_renderer(const std::string& language_name) const;

    bool has_renderer(const std::string& language_name) const;

    /// Run the plugin's registration and keep it alive
    void register_plugin(std::unique_ptr<RendererPlugin> plugin);

    /// Registered language names (lowercase, sorted)
    std::vector<std::string> get_available_languages() const;

    std::optional<LanguageMetadata> get_language_metadata(const std::string& language_name) const;

private:
    RendererRegistry();

    static std::string normalize_language_name(const std::string& name);

    std::map<std::string, std::unique_ptr<BaseRenderer>> renderers_;
    std::vector<std::unique_ptr<RendererPlugin>> plugins_;
};

}  // namespace sqlmarshal::codegen
