#ifndef DSC_DSC_HPP
#define DSC_DSC_HPP

// Umbrella header for embedding the engine

#include "types.hpp"
#include "errors.hpp"
#include "fixed_point.hpp"
#include "log.hpp"
#include "token.hpp"
#include "oracle.hpp"
#include "ledger.hpp"
#include "journal.hpp"
#include "solvency.hpp"
#include "position.hpp"
#include "liquidation.hpp"
#include "engine.hpp"
#include "config.hpp"
#include "deploy.hpp"

namespace dsc {

constexpr const char* version() { return "1.0.0"; }

} // namespace dsc

#endif // DSC_DSC_HPP
