#pragma once

// Umbrella header for the reshape library.

#include <reshape/core/column.hpp>
#include <reshape/core/error.hpp>
#include <reshape/core/table.hpp>
#include <reshape/expand/expand.hpp>
#include <reshape/io/csv.hpp>
#include <reshape/io/print.hpp>
#include <reshape/names/repair.hpp>
#include <reshape/pivot/aggregate.hpp>
#include <reshape/pivot/longer.hpp>
#include <reshape/pivot/spec.hpp>
#include <reshape/pivot/wider.hpp>
#include <reshape/select/selector.hpp>
