#include "balldrop/math/vector_math.hpp"

#include <algorithm>
#include <cmath>

// Position

Position::Position() : x(0), y(0), z(0) {}
Position::Position(double x, double y, double z) : x(x), y(y), z(z) {}

Position::operator Vector() const {
  return Vector(this->x, this->y, this->z);
}

Position Position::operator+(const Vector& v) const {
  return Position(x + v.x, y + v.y, z + v.z);
}

Position Position::operator-(const Vector& v) const {
  return Position(x - v.x, y - v.y, z - v.z);
}

Vector Position::operator-(const Position& p) const {
  return Vector(x - p.x, y - p.y, z - p.z);
}

double Position::dist(const Position& p) const {
  return (*this - p).length();
}

Position& Position::operator+=(const Vector& v) {
  this->x += v.x;
  this->y += v.y;
  this->z += v.z;
  return *this;
}

Position& Position::operator-=(const Vector& v) {
  this->x -= v.x;
  this->y -= v.y;
  this->z -= v.z;
  return *this;
}

bool Position::isFinite() const {
  return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
}

// Vector

Vector::Vector() : x(0), y(0), z(0) {}
Vector::Vector(double x, double y, double z) : x(x), y(y), z(z) {}

Vector::operator Position() const {
  return Position(this->x, this->y, this->z);
}

Vector Vector::operator-() const {
  return Vector(-x, -y, -z);
}

Vector Vector::operator+(const Vector& b) const {
  return Vector(x + b.x, y + b.y, z + b.z);
}

Vector Vector::operator-(const Vector& b) const {
  return Vector(x - b.x, y - b.y, z - b.z);
}

Vector Vector::operator*(const double scalar) const {
  return Vector(x * scalar, y * scalar, z * scalar);
}

Vector Vector::operator/(const double scalar) const {
  return Vector(x / scalar, y / scalar, z / scalar);
}

Vector& Vector::operator+=(const Vector& v) {
  this->x += v.x;
  this->y += v.y;
  this->z += v.z;
  return *this;
}

Vector& Vector::operator-=(const Vector& v) {
  this->x -= v.x;
  this->y -= v.y;
  this->z -= v.z;
  return *this;
}

Vector& Vector::operator*=(const double scalar) {
  this->x *= scalar;
  this->y *= scalar;
  this->z *= scalar;
  return *this;
}

double Vector::length() const {
  return std::sqrt(lengthSquared());
}

double Vector::lengthSquared() const {
  return x * x + y * y + z * z;
}

double Vector::dotProduct(const Vector& v) const {
  return x * v.x + y * v.y + z * v.z;
}

Vector Vector::cross(const Vector& other) const {
  return Vector(y * other.z - z * other.y,
                z * other.x - x * other.z,
                x * other.y - y * other.x);
}

Vector Vector::normalized(const Vector& fallback) const {
  double const len = length();
  if (len < EPSILON || !std::isfinite(len)) {
    return fallback;
  }
  return *this / len;
}

Vector Vector::clampLength(double maxLength) const {
  double const len = length();
  if (len > maxLength && len > EPSILON) {
    return *this * (maxLength / len);
  }
  return *this;
}

Vector Vector::clamp(const Vector& lo, const Vector& hi) const {
  return Vector(std::clamp(x, lo.x, hi.x),
                std::clamp(y, lo.y, hi.y),
                std::clamp(z, lo.z, hi.z));
}

bool Vector::isFinite() const {
  return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
}

Vector operator*(double scalar, const Vector& v) {
  return v * scalar;
}
