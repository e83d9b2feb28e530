//
// Exception types raised by the model loader and the synthesis engine.
//

#pragma once
#include <stdexcept>
#include <string>

namespace sqlmarshal {
    /// Malformed declaration model (YAML structure or type text).
    class model_error : public std::runtime_error {
        public:
            model_error(const std::string& element, const std::string& message)
                : std::runtime_error(element.empty() ? message : element + ": " + message),
                  element_(element) {
            }

            [[nodiscard]] const std::string& element() const { return element_; }

        private:
            std::string element_;
    };

    /// A declared type the generator cannot marshal: a scalar outside the
    /// enumerated set, or an entity without a declaration to map rows onto.
    /// Aborts generation of the declaration.
    class unsupported_type_error : public std::runtime_error {
    public:
        unsupported_type_error(const std::string& type_name, const std::string& context)
            : std::runtime_error(build_message(type_name, context)),
              type_name_(type_name),
              context_(context) {}

        [[nodiscard]] const std::string& type_name() const { return type_name_; }
        [[nodiscard]] const std::string& context() const { return context_; }

    private:
        std::string type_name_;
        std::string context_;

        static std::string build_message(const std::string& type_name,
                                         const std::string& context) {
            std::string msg = "Type '" + type_name + "' is not supported";
            if (!context.empty()) {
                msg += " (" + context + ")";
            }
            return msg;
        }
    };
}
