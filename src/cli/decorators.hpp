#pragma once

#include "termbar/bar/state.hpp"
#include <string>

namespace termbar {
namespace cli {

bar::DecoratorFunc nameDecorator(const std::string& name);
bar::DecoratorFunc counterDecorator(bool as_bytes);
bar::DecoratorFunc etaDecorator();

}}
