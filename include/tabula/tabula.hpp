#pragma once

/// Convenience umbrella header for the Tabula library.

#include <tabula/core/relation.hpp>
#include <tabula/core/row.hpp>
#include <tabula/core/value.hpp>
#include <tabula/runtime/ops.hpp>
#include <tabula/runtime/print.hpp>
