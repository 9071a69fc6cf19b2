#include "rigid2d/math/vector_math.hpp"

#include <cmath>

// Position

Position::Position() : x(0), y(0) {}
Position::Position(double x, double y) : x(x), y(y) {}

Position Position::operator+(const Vector& v) const {
  return {this->x + v.x, this->y + v.y};
}

Position Position::operator-(const Vector& v) const {
  return {this->x - v.x, this->y - v.y};
}

// Vector

Vector::Vector() : x(0), y(0) {}
Vector::Vector(double x, double y) : x(x), y(y) {}
Vector::Vector(const Position& p) : x(p.x), y(p.y) {}

Vector::operator Position() const {
  return {this->x, this->y};
}

Vector Vector::operator-() const {
  return {-this->x, -this->y};
}

Vector Vector::operator+(const Vector& b) const {
  return {this->x + b.x, this->y + b.y};
}

Vector Vector::operator-(const Vector& b) const {
  return {this->x - b.x, this->y - b.y};
}

Vector Vector::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar};
}

Vector Vector::operator/(double scalar) const {
  return {this->x / scalar, this->y / scalar};
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

double Vector::length() const {
  return std::sqrt(this->x * this->x + this->y * this->y);
}

double Vector::lengthSquared() const {
  return this->x * this->x + this->y * this->y;
}

double Vector::distanceTo(const Vector& p) const {
  return (*this - p).length();
}

double Vector::dotProduct(const Vector& v) const {
  return this->x * v.x + this->y * v.y;
}

double Vector::cross(const Vector &other) const {
  return this->x * other.y - this->y * other.x;
}

Vector Vector::perp() const {
  return {-this->y, this->x};
}

Vector Vector::normalized() const {
  double const len = this->length();
  if (len > 1e-12) {
    return {this->x / len, this->y / len};
  }
  // default direction if zero-length vector
  return {1.0, 0.0};
}

Vector Vector::rotateByAngle(double angle) const {
  double const c = std::cos(angle);
  double const s = std::sin(angle);
  return {this->x*c - this->y*s, this->x*s + this->y*c};
}

bool Vector::isFinite() const {
  return std::isfinite(this->x) && std::isfinite(this->y);
}

Vector angularCross(double w, const Vector &r) {
  return {-w * r.y, w * r.x};
}
