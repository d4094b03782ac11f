#include <pubflow/core/plugin.hpp>
#include <utility>

namespace pubflow::core {

IPlugin::IPlugin(std::string name)
    : name_(std::move(name)), logger_("pubflow.plugin." + name_) {}

}  // namespace pubflow::core
