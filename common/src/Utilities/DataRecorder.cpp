/*! @file DataRecorder.cpp
 *  @brief Time series recorder with a fixed set of named channels
 */

#include "Utilities/DataRecorder.h"

#include <set>
#include <stdexcept>

#include "Utilities/ControllerErrors.h"

template <typename T>
DataRecorder<T>::DataRecorder(const std::vector<ChannelDescriptor>& channels,
                              size_t initialCapacity, size_t chunkSize)
    : _channels(channels), _capacity(initialCapacity), _chunkSize(chunkSize) {
  if (_chunkSize == 0) {
    throw ConfigurationError("data recorder chunk size must be positive");
  }

  std::set<std::string> names;
  for (const auto& channel : _channels) {
    if (channel.width == 0) {
      throw ConfigurationError("data recorder channel " + channel.name +
                               " has zero width");
    }
    if (!names.insert(channel.name).second) {
      throw ConfigurationError("duplicate data recorder channel " +
                               channel.name);
    }
    _buffers.push_back(DMat<T>::Zero(channel.width, _capacity));
  }
}

template <typename T>
void DataRecorder<T>::append(size_t index, const std::vector<DVec<T>>& values) {
  if (values.size() != _channels.size()) {
    throw std::invalid_argument("data recorder expected " +
                                std::to_string(_channels.size()) +
                                " channels, got " +
                                std::to_string(values.size()));
  }
  for (size_t c = 0; c < _channels.size(); c++) {
    if ((size_t)values[c].size() != _channels[c].width) {
      throw std::invalid_argument(
          "data recorder channel " + _channels[c].name + " expects width " +
          std::to_string(_channels[c].width) + ", got " +
          std::to_string(values[c].size()));
    }
  }

  if (index >= _capacity) {
    grow(index);
  }

  for (size_t c = 0; c < _channels.size(); c++) {
    _buffers[c].col(index) = values[c];
  }
}

/*!
 * Add whole chunks until index fits.  New columns are zero, old columns are
 * copied over as-is.  Every grown buffer is allocated before any is swapped
 * in, so a failed allocation leaves the recorder as it was.
 */
template <typename T>
void DataRecorder<T>::grow(size_t index) {
  size_t newCapacity = _capacity;
  while (index >= newCapacity) newCapacity += _chunkSize;

  std::vector<DMat<T>> grown;
  grown.reserve(_buffers.size());
  for (const auto& buffer : _buffers) {
    grown.push_back(DMat<T>::Zero(buffer.rows(), newCapacity));
    grown.back().leftCols(_capacity) = buffer;
  }

  for (size_t c = 0; c < _buffers.size(); c++) {
    _buffers[c].swap(grown[c]);
  }
  _capacity = newCapacity;
}

template <typename T>
std::map<std::string, DMat<T>> DataRecorder<T>::exportData(
    size_t length) const {
  if (length > _capacity) {
    throw std::out_of_range("data recorder export of " +
                            std::to_string(length) + " columns exceeds " +
                            std::to_string(_capacity));
  }

  std::map<std::string, DMat<T>> data;
  for (size_t c = 0; c < _channels.size(); c++) {
    data[_channels[c].name] = _buffers[c].leftCols(length);
  }
  return data;
}

template <typename T>
int DataRecorder<T>::channelIndex(const std::string& name) const {
  for (size_t c = 0; c < _channels.size(); c++) {
    if (_channels[c].name == name) return (int)c;
  }
  return -1;
}

template class DataRecorder<double>;
template class DataRecorder<float>;
