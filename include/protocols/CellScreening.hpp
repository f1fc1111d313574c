#pragma once
/** @file  CellScreening.hpp
 *  @brief Built-in cell line screening workflow and its workcell roster.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include "protocols/TransferStep.hpp"

namespace labcell::protocols {

  inline constexpr const char* kCellScreeningProtocol = "cell_screening";
  inline constexpr const char* kCellScreeningPlate = "CELL_CULTURE_PLATE_001";

  /**
   * @brief Storage → LiquidHandler → Centrifuge → ThermalCycler → PlateReader
   *        → Storage, processing at each instrument, then park the arm.
   */
  Protocol cellScreeningProtocol(const std::string& plateId);

} // namespace labcell::protocols
