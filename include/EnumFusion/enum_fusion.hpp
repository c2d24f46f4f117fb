#pragma once

#include "key_meta.hpp"
#include "key_traits.hpp"
#include "key_name.hpp"
#include "enum_map.hpp"
#include "literal.hpp"
#include "parser.hpp"
#include "serializer.hpp"
#include "arbitrary.hpp"
#include "format.hpp"
