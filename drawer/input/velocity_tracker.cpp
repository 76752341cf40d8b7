#include "velocity_tracker.hpp"
#include <boost/container/small_vector.hpp>
#include <cmath>

namespace drawer::input {

void VelocityTracker::addPosition(double time, float2 position) {
  head = (head + 1) % HistorySize;
  samples[head] = Sample{time, position};
  if (count < HistorySize)
    ++count;
}

void VelocityTracker::reset() {
  head = 0;
  count = 0;
}

float2 VelocityTracker::getVelocity() const {
  boost::container::small_vector<Sample, HistorySize> window;

  // Walk back from the newest sample
  const Sample &newest = samples[head];
  double previousTime = newest.time;
  for (size_t i = 0; i < count; i++) {
    const Sample &sample = samples[(head + HistorySize - i) % HistorySize];
    double age = newest.time - sample.time;
    if (age > horizon || previousTime - sample.time > stopGap)
      break;
    window.push_back(sample);
    previousTime = sample.time;
  }

  if (window.size() < 2)
    return float2{};

  double meanT{};
  double2 meanP{};
  for (auto &sample : window) {
    meanT += sample.time;
    meanP += double2(sample.position);
  }
  meanT /= double(window.size());
  meanP /= double(window.size());

  double varT{};
  double2 covTP{};
  for (auto &sample : window) {
    double dt = sample.time - meanT;
    varT += dt * dt;
    covTP += (double2(sample.position) - meanP) * dt;
  }

  // All samples at the same instant
  if (varT <= 0.0)
    return float2{};

  float2 velocity = float2(covTP / varT);
  float speed = linalg::length(velocity);
  if (speed > maxVelocity)
    velocity *= maxVelocity / speed;
  return velocity;
}

} // namespace drawer::input
