//
// Renderer Registry Implementation
//

#include <sqlmarshal/renderer_plugin.hh>
#include <sqlmarshal/renderer_registry.hh>
#include <algorithm>
#include <cctype>

namespace sqlmarshal::codegen {

// Defined in csharp_renderer_plugin.cc
void ensure_csharp_renderer_registered();

RendererRegistry& RendererRegistry::instance() {
    static RendererRegistry registry;

    // Static initialization order across translation units is unspecified;
    // referencing the plugin unit forces it to be linked and initialized.
    static bool initialized = false;
    if (!initialized) {
        initialized = true;
        ensure_csharp_renderer_registered();
    }

    return registry;
}

RendererRegistry::RendererRegistry() = default;

void RendererRegistry::register_renderer(const std::string& language_name,
                                         std::unique_ptr<BaseRenderer> renderer) {
    renderers_[normalize_language_name(language_name)] = std::move(renderer);
}

BaseRenderer* RendererRegistry::get_renderer(const std::string& language_name) const {
    auto it = renderers_.find(normalize_language_name(language_name));
    return (it != renderers_.end()) ? it->second.get() : nullptr;
}

bool RendererRegistry::has_renderer(const std::string& language_name) const {
    return renderers_.find(normalize_language_name(language_name)) != renderers_.end();
}

void RendererRegistry::register_plugin(std::unique_ptr<RendererPlugin> plugin) {
    if (plugin) {
        plugin->register_renderer(*this);
        plugins_.push_back(std::move(plugin));
    }
}

std::vector<std::string> RendererRegistry::get_available_languages() const {
    std::vector<std::string> languages;
    languages.reserve(renderers_.size());
    for (const auto& [name, _] : renderers_) {
        languages.push_back(name);
    }
    return languages;
}

std::optional<LanguageMetadata> RendererRegistry::get_language_metadata(
    const std::string& language_name) const {
    BaseRenderer* renderer = get_renderer(language_name);
    if (!renderer) {
        return std::nullopt;
    }
    return renderer->get_metadata();
}

std::string RendererRegistry::normalize_language_name(const std::string& name) {
    std::string normalized = name;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized;
}

}  // namespace sqlmarshal::codegen
