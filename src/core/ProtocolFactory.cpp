/* @file ProtocolFactory.cpp
 * @brief protocol registry
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "core/ProtocolFactory.hpp"
#include "protocols/CellScreening.hpp"

using namespace labcell::core;

ProtocolFactory ProtocolFactory::withBuiltins() {
  ProtocolFactory factory;
  factory.registerProtocol(protocols::kCellScreeningProtocol, protocols::cellScreeningProtocol);
  return factory;
}

bool ProtocolFactory::registerProtocol(const std::string& name, Creator maker) {
  if (name.empty() || !maker)
    throw std::invalid_argument("[ProtocolFactory] protocol needs a name and a creator");
  return creators_.emplace(name, std::move(maker)).second;
}

labcell::protocols::Protocol ProtocolFactory::create(const std::string& name,
                                                     const std::string& plateId) const {
  auto it = creators_.find(name);
  if (it == creators_.end())
    throw std::out_of_range("[ProtocolFactory] unknown protocol: " + name);
  return it->second(plateId);
}

std::vector<std::string> ProtocolFactory::names() const {
  std::vector<std::string> out;
  out.reserve(creators_.size());
  for (const auto& [name, _] : creators_)
    out.push_back(name);
  std::sort(out.begin(), out.end());
  return out;
}
