#pragma once
/** @file  ProtocolFactory.hpp
 *  @brief Runtime registry that maps protocol names to step-list creators.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "protocols/TransferStep.hpp"

namespace labcell::core {

  /**
 * @class ProtocolFactory
 * @brief Register & instantiate protocols by string key.
 *
 *  * Keeps SystemCoordinator decoupled from concrete protocols.
 *  * Creators receive the id of the plate the protocol should move.
 */
  class ProtocolFactory {
  public:
    using Creator = std::function<protocols::Protocol(const std::string& plateId)>;

    /// Factory pre-loaded with every built-in protocol.
    static ProtocolFactory withBuiltins();

    /// Register a protocol under \p name.  Returns false on duplicate.
    bool registerProtocol(const std::string& name, Creator maker);

    /// Create a fresh step list or throw `std::out_of_range` if unknown.
    protocols::Protocol create(const std::string& name, const std::string& plateId) const;

    bool contains(const std::string& name) const { return creators_.count(name) != 0; }

    /// Registered names, sorted.
    std::vector<std::string> names() const;

  private:
    std::unordered_map<std::string, Creator> creators_;
  };

} // namespace labcell::core
