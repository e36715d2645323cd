#pragma once

#include "./argument.hpp"
#include "./argument_parser.hpp"
#include "./error.hpp"
