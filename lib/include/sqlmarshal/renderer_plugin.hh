//
// Renderer Plugin Interface
//
// Lets a renderer register itself with the RendererRegistry without the
// registry depending on concrete renderer types.
//

#pragma once

#include <memory>
#include <string>

namespace sqlmarshal::codegen {

class RendererRegistry;

class RendererPlugin {
public:
    virtual ~RendererPlugin() = default;

    /// Called once, when the plugin is handed to the registry
    virtual void register_renderer(RendererRegistry& registry) = 0;

    /// Language name the plugin provides ("csharp")
    virtual std::string get_name() const = 0;

    virtual std::string get_version() const = 0;
};

/**
 * Register a plugin during static initialization.
 *
 *   REGISTER_RENDERER_PLUGIN(CSharpRendererPlugin);
 *
 * Expands to a file-local registrar object whose constructor hands a new
 * plugin instance to RendererRegistry::instance().
 */
#define REGISTER_RENDERER_PLUGIN(PluginClass)                                  \
    namespace {                                                                 \
        struct PluginClass##_Registrar {                                        \
            PluginClass##_Registrar();                                          \
        };                                                                      \
        static PluginClass##_Registrar g_##PluginClass##_registrar;            \
        PluginClass##_Registrar::PluginClass##_Registrar() {                   \
            RendererRegistry::instance().register_plugin(                       \
                std::make_unique<PluginClass>()                                 \
            );                                                                  \
        }                                                                       \
    }

}  // namespace sqlmarshal::codegen
