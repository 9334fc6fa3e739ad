#include "tiltbox/math/vector_math.hpp"

#include <algorithm>
#include <cmath>

bool nearlyEqual(double a, double b, double epsilon) {
  return std::fabs(a - b) < epsilon;
}

Vector::Vector() : x(0), y(0) {}
Vector::Vector(double x, double y) : x(x), y(y) {}

// operators

Vector Vector::operator-() const {
  return Vector(-this->x, -this->y);
}

Vector Vector::operator+(const Vector& b) const {
  return Vector(this->x + b.x, this->y + b.y);
}

Vector Vector::operator-(const Vector& b) const {
  return Vector(this->x - b.x, this->y - b.y);
}

Vector Vector::operator*(const double scalar) const {
  return Vector(this->x * scalar, this->y * scalar);
}

Vector Vector::operator/(const double scalar) const {
  return Vector(this->x / scalar, this->y / scalar);
}

Vector& Vector::operator+=(const Vector& b) {
  this->x += b.x;
  this->y += b.y;
  return *this;
}

Vector& Vector::operator-=(const Vector& b) {
  this->x -= b.x;
  this->y -= b.y;
  return *this;
}

Vector& Vector::operator*=(const double scalar) {
  this->x *= scalar;
  this->y *= scalar;
  return *this;
}

bool Vector::operator==(const Vector& other) const {
  return isCloseTo(other);
}

bool Vector::operator!=(const Vector& other) const {
  return !isCloseTo(other);
}

Vector operator*(double scalar, const Vector& v) {
  return v * scalar;
}

// vector math

Vector Vector::to(const Vector& other) const {
  return other - *this;
}

double Vector::dotProduct(const Vector& v) const {
  return this->x * v.x + this->y * v.y;
}

double Vector::cross(const Vector& other) const {
  return this->x * other.y - this->y * other.x;
}

Vector Vector::perpendicular() const { // clockwise 90 degrees
  return Vector(this->y, -this->x);
}

Vector Vector::rotateByAngle(double angle) const {
  double const c = std::cos(angle);
  double const s = std::sin(angle);
  return Vector(this->x * c - this->y * s, this->x * s + this->y * c);
}

double Vector::length() const {
  return std::sqrt(this->dotProduct(*this));
}

Vector Vector::unit() const {
  return *this / this->length();
}

double Vector::angleTo(const Vector& other) const {
  double const cosine = std::clamp(this->unit().dotProduct(other.unit()), -1.0, 1.0);
  return std::acos(cosine) * (this->cross(other) > 0.0 ? 1.0 : -1.0);
}

Vector Vector::tripleProduct(const Vector& other) const {
  Vector const segment = other.to(*this);
  return -other * segment.dotProduct(segment) - segment * segment.dotProduct(-other);
}

bool Vector::isCloseTo(const Vector& other) const {
  return nearlyEqual(this->x, other.x) && nearlyEqual(this->y, other.y);
}

bool Vector::isFinite() const {
  return std::isfinite(this->x) && std::isfinite(this->y);
}
