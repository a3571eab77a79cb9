#include "snooker/math/vector_math.hpp"

#include <cmath>

bool nearlyEqual(double a, double b, double epsilon) {
  return std::fabs(a - b) < epsilon;
}

double remap(double value, double inMin, double inMax, double outMin, double outMax) {
  double const span = inMax - inMin;
  if (std::fabs(span) < EPSILON) {
    return outMin;
  }
  return outMin + (value - inMin) * (outMax - outMin) / span;
}

// Position

Position::Position() : x(0), y(0) {}
Position::Position(double x, double y) : x(x), y(y) {}

Position::operator Vector() const {
  return Vector(this->x, this->y);
}

Position Position::operator+(const Vector& offset) const {
  return Position(this->x + offset.x, this->y + offset.y);
}

Position Position::operator-(const Vector& offset) const {
  return Position(this->x - offset.x, this->y - offset.y);
}

double Position::dist(const Position& p) const {
  double const dx = this->x - p.x;
  double const dy = this->y - p.y;
  return std::sqrt(dx * dx + dy * dy);
}

Vector Position::offsetFrom(const Position& from) const {
  return Vector(this->x - from.x, this->y - from.y);
}

// Vector

Vector::Vector() : x(0), y(0) {}
Vector::Vector(double x, double y) : x(x), y(y) {}

Vector Vector::fromAngle(double angle, double length) {
  return Vector(std::cos(angle) * length, std::sin(angle) * length);
}

Vector::operator Position() const {
  return Position(this->x, this->y);
}

Vector Vector::operator-() const {
  return Vector(-this->x, -this->y);
}

Vector Vector::operator+(const Vector& b) const {
  return Vector(this->x + b.x, this->y + b.y);
}

Vector Vector::operator-(const Vector& b) const {
  return Vector(this->x - b.x, this->y - b.y);
}

Vector Vector::operator*(double scalar) const {
  return Vector(this->x * scalar, this->y * scalar);
}

Vector Vector::operator/(double scalar) const {
  return Vector(this->x / scalar, this->y / scalar);
}

Vector& Vector::operator+=(const Vector& v) {
  this->x += v.x;
  this->y += v.y;
  return *this;
}

Vector& Vector::operator-=(const Vector& v) {
  this->x -= v.x;
  this->y -= v.y;
  return *this;
}

Vector& Vector::operator*=(double scalar) {
  this->x *= scalar;
  this->y *= scalar;
  return *this;
}

double Vector::length() const {
  return std::sqrt(this->x * this->x + this->y * this->y);
}

double Vector::dotProduct(const Vector& v) const {
  return this->x * v.x + this->y * v.y;
}

Vector Vector::normalized() const {
  double const len = length();
  if (len < EPSILON) {
    return Vector();
  }
  return *this / len;
}

Vector Vector::withLength(double length) const {
  return normalized() * length;
}

double Vector::angle() const {
  return std::atan2(this->y, this->x);
}

Vector Vector::reflect(const Vector& normal) const {
  double const d = dotProduct(normal);
  return *this - normal * (2.0 * d);
}

Vector Vector::clampedLength(double maxLength) const {
  double const len = length();
  if (len > maxLength && len > EPSILON) {
    return *this * (maxLength / len);
  }
  return *this;
}
