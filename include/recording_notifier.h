#ifndef RECORDING_NOTIFIER_H
#define RECORDING_NOTIFIER_H

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

struct RecordingStatusEvent {
  bool recording = false;
  std::optional<uint64_t> frequencyHz;
};

std::string recordingStatusJson(const RecordingStatusEvent &event);

// Fans capture start/stop out to registered observers. Observers are called
// with the registry lock released and must not block; one that throws is
// dropped.
class RecordingNotifier {
public:
  using Observer = std::function<void(const RecordingStatusEvent &event)>;
  using Handle = uint64_t;

  Handle addObserver(Observer observer);
  bool removeObserver(Handle handle);
  size_t observerCount() const;

  void notify(const RecordingStatusEvent &event);

private:
  mutable std::mutex m_mutex;
  std::map<Handle, Observer> m_observers;
  Handle m_nextHandle = 1;
};

#endif
