#include "rigid2d/core/vars_list.hpp"

#include <cmath>
#include <stdexcept>

VarsList::VarsList() : values{0.0}, names{"time"} {}

int VarsList::addBody(const std::string& name) {
  int const base = numVariables();
  static const char* suffixes[SlotsPerBody] = {
    " x", " vx", " y", " vy", " angle", " angular velocity"
  };
  for (const char* suffix : suffixes) {
    values.push_back(0.0);
    names.push_back(name + suffix);
  }
  savedValues.clear();
  return base;
}

void VarsList::clear() {
  values.assign(1, 0.0);
  names.assign(1, "time");
  savedValues.clear();
}

double VarsList::getValue(int index) const {
  return values.at(index);
}

void VarsList::setValue(int index, double value) {
  values.at(index) = value;
}

void VarsList::setValues(const std::vector<double>& newValues) {
  if (newValues.size() != values.size()) {
    throw std::invalid_argument("VarsList::setValues size mismatch");
  }
  values = newValues;
}

void VarsList::saveState() {
  savedValues = values;
}

bool VarsList::restoreState() {
  if (savedValues.size() != values.size()) {
    return false;
  }
  values = savedValues;
  return true;
}

bool VarsList::allFinite() const {
  for (double v : values) {
    if (!std::isfinite(v)) {
      return false;
    }
  }
  return true;
}
