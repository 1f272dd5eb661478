#pragma once

#include "scalarset/errors.hpp"
#include "scalarset/key_iterator.hpp"
#include "scalarset/ordered_hashmap.hpp"
#include "scalarset/scalar.hpp"
#include "scalarset/set.hpp"
