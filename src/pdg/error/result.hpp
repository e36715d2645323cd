#pragma once

#include "./result_fwd.hpp"

#include <boost/leaf/error.hpp>
#include <boost/leaf/result.hpp>

namespace pdg {

using boost::leaf::new_error;

}  // namespace pdg
