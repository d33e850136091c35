/*
 * *****************************************************************************
 * TELEMETRY
 * *****************************************************************************
 * Per-dome time series for reporting and plotting:
 * - One TelemetrySample per committed tick
 * - Fixed capacity ring buffer, oldest sample overwritten when full
 * - getAll() returns samples oldest to newest
 * *****************************************************************************
 */

#pragma once

#include "dome_types.h"

#include <stddef.h>
#include <vector>

struct TelemetrySample {
  double time_s;
  Mode mode;
  SensorReading reading;
  ActuatorCommand command;
  Setpoint setpoint;
  EnergyLedger ledger;
  AlertLevel alert;
};

// --- RingBuffer<T> ---

template<typename T>
class RingBuffer {
private:
  std::vector<T> buffer;
  size_t head;
  size_t count;

public:
  explicit RingBuffer(size_t capacity)
      : buffer(capacity > 0 ? capacity : 1), head(0), count(0) {}

  void push(const T &value) {
    buffer[head] = value;
    head = (head + 1) % buffer.size();
    if (count < buffer.size()) count++;
  }

  std::vector<T> getAll() const {
    std::vector<T> out;
    out.reserve(count);
    // When full, head points to the oldest entry
    size_t start = (count < buffer.size()) ? 0 : head;
    for (size_t i = 0; i < count; i++) {
      out.push_back(buffer[(start + i) % buffer.size()]);
    }
    return out;
  }

  const T *latest() const {
    if (count == 0) return nullptr;
    return &buffer[(head + buffer.size() - 1) % buffer.size()];
  }

  size_t size() const { return count; }
  size_t capacity() const { return buffer.size(); }

  void clear() {
    head = 0;
    count = 0;
  }
};

typedef RingBuffer<TelemetrySample> TelemetryBuffer;
