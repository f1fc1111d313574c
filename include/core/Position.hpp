#pragma once
/** @file  Position.hpp
 *  @brief Immutable 3D point in workcell coordinates (millimetres).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>
#include <utility>

namespace labcell {
  namespace core {

    /**
 * @class Position
 * @brief (x, y, z) in mm plus a cosmetic label used by the console reports.
 *
 *  * Equality ignores the label.
 */
    class Position {
    public:
      Position() = default;
      Position(double x, double y, double z, std::string label = "")
          : x_(x), y_(y), z_(z), label_(std::move(label)) {}

      double x() const { return x_; }
      double y() const { return y_; }
      double z() const { return z_; }
      const std::string& label() const { return label_; }

      /// Straight-line distance in mm.
      double distanceTo(const Position& other) const;

      bool operator==(const Position& other) const {
        return x_ == other.x_ && y_ == other.y_ && z_ == other.z_;
      }
      bool operator!=(const Position& other) const { return !(*this == other); }

    private:
      double x_{ 0.0 };
      double y_{ 0.0 };
      double z_{ 0.0 };
      std::string label_{};
    };

  } // namespace core
} // namespace labcell
