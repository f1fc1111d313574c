/* @file CellScreening.cpp
 * @brief step list for the built-in screening run
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "protocols/CellScreening.hpp"

namespace labcell::protocols {

  Protocol cellScreeningProtocol(const std::string& plateId) {
    using core::Seconds;
    return {
      TransferStep::transfer("STEP 1: Retrieve plate from cold storage", plateId, "Storage",
                             "LiquidHandler"),
      TransferStep::process("STEP 2: Add cell culture media and reagents", plateId,
                            "LiquidHandler", Seconds{ 3.0 }),
      TransferStep::transfer("STEP 2.5: Centrifuge to pellet cells", plateId, "LiquidHandler",
                             "Centrifuge"),
      TransferStep::process("STEP 2.5: Spin down", plateId, "Centrifuge", Seconds{ 2.0 }),
      TransferStep::transfer("STEP 3: Transfer to thermal cycler for incubation", plateId,
                             "Centrifuge", "ThermalCycler"),
      TransferStep::process("STEP 4: Incubate at 37°C", plateId, "ThermalCycler",
                            Seconds{ 4.0 }),
      TransferStep::transfer("STEP 5: Transfer to plate reader for analysis", plateId,
                             "ThermalCycler", "PlateReader"),
      TransferStep::process("STEP 6: Read absorbance at 450nm", plateId, "PlateReader",
                            Seconds{ 2.0 }),
      TransferStep::transfer("STEP 7: Return plate to storage", plateId, "PlateReader",
                             "Storage"),
      TransferStep::returnHome("STEP 8: Robot returning to home position"),
    };
  }

} // namespace labcell::protocols
