#pragma once
#include "SensorReading.hpp"

// Pull-style source of records. next() blocks until a record is ready;
// false means the stream ended for good.
template <typename T>
class IDataSource {
public:
  virtual ~IDataSource() = default;
  virtual bool next(T& out) = 0;
};
