#pragma once

// jsonv: a header-only C++17 streaming JSON decoder that validates against a
// declarative schema while writing straight into typed destinations.
// Rule violations are collected with their paths instead of stopping the
// decode; only broken input or transport failures are fatal.

#include "error.hpp"
#include "logging.hpp"
#include "reader.hpp"
#include "scanner.hpp"
#include "unquote.hpp"
#include "path.hpp"
#include "type_desc.hpp"
#include "validators.hpp"
#include "schema.hpp"
#include "scalars.hpp"
#include "object.hpp"
#include "slice.hpp"
#include "enum.hpp"
#include "unmarshaler.hpp"
#include "parser.hpp"
