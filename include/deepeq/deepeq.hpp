#pragma once

/** \file deepeq.hpp
 *  \brief Umbrella header for structural object-graph comparison.
 */

#include "deepeq/error.hpp"
#include "deepeq/type_registry.hpp"
#include "deepeq/property_path.hpp"
#include "deepeq/comparison_result.hpp"
#include "deepeq/cyclic_reference_tracker.hpp"
#include "deepeq/rules/selection_rules.hpp"
#include "deepeq/rules/matching_rules.hpp"
#include "deepeq/rules/assertion_rules.hpp"
#include "deepeq/configuration.hpp"
#include "deepeq/comparison_engine.hpp"
