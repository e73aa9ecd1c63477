#pragma once

#include <doctest/doctest.h>
#include <doctest/trompeloeil.hpp>

using trompeloeil::_;
