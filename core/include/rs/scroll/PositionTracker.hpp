#pragma once
#include "rs/events/ListenerList.hpp"
#include "rs/scroll/ScrollSource.hpp"
#include <cstdint>
#include <memory>

namespace rs {

enum class PositionModel : std::uint8_t { Continuous, Paged };

const char* toString(PositionModel m);

// Normalized metrics. Paged sources report offset = page * viewport and
// maxExtent = (pageCount - 1) * viewport.
struct TrackerMetrics {
  double offset{0.0};
  double viewportExtent{0.0};
  double maxExtent{0.0};
};

// Uniform view over a continuous or paged source. The variant is chosen
// once at construction (see makePositionTracker).
//
// Positions are pixels for Continuous and page indices for Paged.
class PositionTracker {
public:
  virtual ~PositionTracker() = default;

  virtual PositionModel model() const = 0;

  // Scroll index in viewports: offset/viewport, or the page.
  virtual double currentFraction() const = 0;

  // Authoritative position the rotary estimate resyncs to. Paged truncates
  // to the integer page.
  virtual double position() const = 0;

  virtual double extentBefore() const = 0;
  virtual double extentAfter() const = 0;

  // Nearest position moveTo() can actually reach.
  virtual double clampPosition(double position) const = 0;

  virtual TrackerMetrics metrics() const = 0;

  virtual void moveTo(double target, const MotionSpec& motion, MoveDoneCallback onDone) = 0;

  // (0,1] when the viewport has extent, 0 otherwise.
  double thumbFraction() const;
  bool isScrollable() const;

  ListenerId addListener(ScrollListener cb) { return listeners_.add(std::move(cb)); }
  void removeListener(ListenerId id) { listeners_.remove(id); }

protected:
  void notify(const ScrollChange& change) { listeners_.notify(change); }

private:
  ListenerList<const ScrollChange&> listeners_;
};

class ContinuousPositionTracker : public PositionTracker {
public:
  explicit ContinuousPositionTracker(ScrollSource& source);
  ~ContinuousPositionTracker() override;

  ContinuousPositionTracker(const ContinuousPositionTracker&) = delete;
  ContinuousPositionTracker& operator=(const ContinuousPositionTracker&) = delete;

  PositionModel model() const override { return PositionModel::Continuous; }
  double currentFraction() const override;
  double position() const override;
  double extentBefore() const override;
  double extentAfter() const override;
  double clampPosition(double position) const override;
  TrackerMetrics metrics() const override;
  void moveTo(double target, const MotionSpec& motion, MoveDoneCallback onDone) override;

private:
  ScrollSource& source_;
  ListenerId sub_{0};
};

class PagedPositionTracker : public PositionTracker {
public:
  explicit PagedPositionTracker(PageSource& source);
  ~PagedPositionTracker() override;

  PagedPositionTracker(const PagedPositionTracker&) = delete;
  PagedPositionTracker& operator=(const PagedPositionTracker&) = delete;

  PositionModel model() const override { return PositionModel::Paged; }
  double currentFraction() const override;
  double position() const override;
  double extentBefore() const override;
  double extentAfter() const override;
  double clampPosition(double position) const override;
  TrackerMetrics metrics() const override;
  void moveTo(double target, const MotionSpec& motion, MoveDoneCallback onDone) override;

private:
  double lastPage() const;

  PageSource& source_;
  ListenerId sub_{0};
};

std::unique_ptr<PositionTracker> makePositionTracker(ScrollSource& source);
std::unique_ptr<PositionTracker> makePositionTracker(PageSource& source);

} // namespace rs
