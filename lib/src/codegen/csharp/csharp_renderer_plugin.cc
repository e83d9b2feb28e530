//
// C# Renderer Plugin
//
// Registers CSharpRenderer with the RendererRegistry during static
// initialization.
//

#include <sqlmarshal/renderer_plugin.hh>
#include <sqlmarshal/renderer_registry.hh>
#include <sqlmarshal/codegen/csharp/csharp_renderer.hh>

namespace sqlmarshal::codegen {

class CSharpRendererPlugin : public RendererPlugin {
public:
    void register_renderer(RendererRegistry& registry) override {
        registry.register_renderer("csharp", std::make_unique<CSharpRenderer>());
    }

    [[nodiscard]] std::string get_name() const override {
        return "csharp";
    }

    [[nodiscard]] std::string get_version() const override {
        return "1.0.0";
    }
};

REGISTER_RENDERER_PLUGIN(CSharpRendererPlugin);

/**
 * Called by RendererRegistry::instance() so that the linker keeps this
 * translation unit, and with it the registrar above.
 */
void ensure_csharp_renderer_registered() {
}

}  // namespace sqlmarshal::codegen
