#ifndef CCA_CCA_HPP
#define CCA_CCA_HPP

/**
 * @file cca.hpp
 * @brief Umbrella header for the circuit cost analyzer.
 */

#include "cca/version.hpp"
#include "cca/error.hpp"
#include "cca/result.hpp"
#include "cca/types.hpp"
#include "cca/config.hpp"
#include "cca/engine.hpp"
#include "cca/exporters/json_exporter.hpp"
#include "cca/profiler/backend.hpp"

#endif //CCA_CCA_HPP
