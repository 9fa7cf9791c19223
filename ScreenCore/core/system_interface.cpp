#include "core/system_interface.hpp"

static std::unique_ptr<SystemInterface> instance;

void SystemInterface::initialize(std::unique_ptr<SystemInterface> instance_in) {
    instance = std::move(instance_in);
}

SystemInterface& SystemInterface::get() {
    if(instance == nullptr) {
        instance = std::make_unique<DesktopSystemInterface>();
    }

    return *instance;
}
