/*! @file DataRecorder.h
 *  @brief Time series recorder with a fixed set of named channels
 *
 *  Each channel has a fixed width and stores one column per control tick.
 *  Storage grows in whole chunks when the write index reaches the capacity;
 *  columns that were already written are carried over unchanged.
 */

#ifndef WOOFER_DATARECORDER_H
#define WOOFER_DATARECORDER_H

#include <map>
#include <string>
#include <vector>

#include "cppTypes.h"

/*!
 * Name and width of one recorded channel
 */
struct ChannelDescriptor {
  std::string name;
  size_t width;
};

template <typename T>
class DataRecorder {
 public:
  DataRecorder(const std::vector<ChannelDescriptor>& channels,
               size_t initialCapacity, size_t chunkSize);

  /*!
   * Write one column at index, growing every channel first if needed.
   * values holds one vector per channel, in descriptor order.  Widths are
   * checked before anything is written.
   */
  void append(size_t index, const std::vector<DVec<T>>& values);

  /*!
   * Copy of the first length columns of every channel, keyed by name
   */
  std::map<std::string, DMat<T>> exportData(size_t length) const;

  const DMat<T>& channelData(size_t channel) const { return _buffers[channel]; }
  int channelIndex(const std::string& name) const;
  const std::vector<ChannelDescriptor>& channels() const { return _channels; }
  size_t numChannels() const { return _channels.size(); }
  size_t capacity() const { return _capacity; }
  size_t chunkSize() const { return _chunkSize; }

 private:
  void grow(size_t index);

  std::vector<ChannelDescriptor> _channels;
  std::vector<DMat<T>> _buffers;
  size_t _capacity;
  size_t _chunkSize;
};

#endif  // WOOFER_DATARECORDER_H
