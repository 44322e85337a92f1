#pragma once

#include <vector>

#include "app/config_types.hpp"

namespace humin::app {

Stats calc_stats(std::vector<double> values);

}  // namespace humin::app
