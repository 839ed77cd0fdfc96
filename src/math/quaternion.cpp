#include "balldrop/math/quaternion.hpp"

#include <cmath>

#include "balldrop/core/constants.hpp"

Quaternion::Quaternion() : w(1), x(0), y(0), z(0) {}
Quaternion::Quaternion(double w, double x, double y, double z) : w(w), x(x), y(y), z(z) {}

Quaternion Quaternion::fromAxisAngle(const Vector& axis, double angle) {
  Vector const n = axis.normalized(Vector(0.0, 0.0, 1.0));
  double const half = angle * 0.5;
  double const s = std::sin(half);
  return Quaternion(std::cos(half), n.x * s, n.y * s, n.z * s);
}

Quaternion Quaternion::fromRollDegrees(double degrees) {
  return fromAxisAngle(Vector(0.0, 0.0, 1.0), degrees * SimulatorConstants::Pi / 180.0);
}

double Quaternion::norm() const {
  return std::sqrt(w * w + x * x + y * y + z * z);
}

Quaternion Quaternion::normalized() const {
  double const n = norm();
  if (n < EPSILON || !std::isfinite(n)) {
    return Quaternion();
  }
  return Quaternion(w / n, x / n, y / n, z / n);
}

Quaternion Quaternion::conjugate() const {
  return Quaternion(w, -x, -y, -z);
}

Vector Quaternion::rotate(const Vector& v) const {
  // v' = v + 2w(u x v) + 2u x (u x v), u = vector part
  Vector const u(x, y, z);
  Vector const t = u.cross(v) * 2.0;
  return v + t * w + u.cross(t);
}

bool Quaternion::isFinite() const {
  return std::isfinite(w) && std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
}
