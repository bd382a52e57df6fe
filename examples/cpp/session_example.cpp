#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "inkvault/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/session/editing_session.hpp"
#include "internal/session/rendering_surface.hpp"

namespace {

using inkvault::v1::AnnotationState;

/*
  Stand-in for a drawing canvas: keeps the drawing in memory and answers
  every request straight back into the session.
*/
class LoopbackSurface final : public inkvault::session::RenderingSurface {
 public:
  void Attach(std::shared_ptr<inkvault::session::EditingSession> session) {
    std::lock_guard lock(mutex_);
    session_ = std::move(session);
  }

  void Draw(double x, double y) {
    std::lock_guard lock(mutex_);
    auto*           stroke = drawing_.add_strokes();
    stroke->set_color("#ff0000");
    stroke->set_thickness(2.0);
    auto* p = stroke->add_points();
    p->set_x(x);
    p->set_y(y);
  }

  void RequestCurrentState(uint64_t request_id) override {
    std::lock_guard lock(mutex_);
    if (session_) session_->OnCurrentState(request_id, drawing_);
  }

  void LoadState(uint64_t target, const AnnotationState& state) override {
    std::lock_guard lock(mutex_);
    drawing_ = state;
    if (session_) session_->OnLoadConfirmed(target);
  }

  void ShowStatus(const inkvault::session::SessionView& view) override {
    std::cout << "cursor=" << (view.cursor ? std::to_string(*view.cursor) : "-") << " snapshots=" << view.snapshots
              << " bookmarks=" << view.bookmarks << " undo=" << view.can_undo << " redo=" << view.can_redo
              << " protected=" << view.is_protected << " done=" << view.done << '\n';
  }

 private:
  std::mutex                                         mutex_;
  AnnotationState                                    drawing_;
  std::shared_ptr<inkvault::session::EditingSession> session_;
};

void Wait(std::chrono::milliseconds d) {
  std::this_thread::sleep_for(d);
}

} // namespace

int main(int argc, char** argv) {
  inkvault::runtime::config::RuntimeConfig config;
  if (argc > 1) {
    config = inkvault::config::ConfigLoader::LoadFromYaml(argv[1]);
  } else {
    config.mutable_storage()->set_root("./inkvault-example");
    inkvault::config::ConfigLoader::ApplyDefaults(&config);
  }
  inkvault::observability::InitializeLogging(config);

  auto app = inkvault::factory::Build(config);

  inkvault::v1::ImageDimensions dims;
  dims.set_width(4096);
  dims.set_height(3072);

  LoopbackSurface surface;
  auto            session = app.sessions->Open("example-slide", dims, surface);
  surface.Attach(session);

  // Two edits, each picked up by the next tick.
  surface.Draw(10, 10);
  Wait(std::chrono::milliseconds(1500));
  surface.Draw(20, 20);
  Wait(std::chrono::milliseconds(1500));

  // Step back; the restored drawing is not saved again.
  session->Undo();
  Wait(std::chrono::milliseconds(3000));

  session->SaveCurrentView();
  Wait(std::chrono::milliseconds(500));

  auto view = session->Describe().get();
  std::cout << "final cursor=" << (view.cursor ? std::to_string(*view.cursor) : "-") << " bookmarked=" << view.cursor_bookmarked << '\n';

  surface.Attach(nullptr);
  app.sessions->CloseAll();
  inkvault::observability::ShutdownLogging();
  return 0;
}
