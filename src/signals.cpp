#include "signals.hpp"
#include <csignal>
#include <signal.h>

static volatile sig_atomic_t g_resize = 0;
static volatile sig_atomic_t g_suspend = 0;
static volatile sig_atomic_t g_resumed = 0;
static volatile sig_atomic_t g_terminate = 0;

static void on_signal(int sig) {
  switch (sig) {
    case SIGWINCH: g_resize = 1; break;
    case SIGTSTP: g_suspend = 1; break;
    case SIGCONT: g_resumed = 1; break;
    default: g_terminate = 1; break;
  }
}

void install_signal_handlers() {
  struct sigaction sa{};
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0; // no SA_RESTART: the blocking poll must see EINTR
  sigaction(SIGWINCH, &sa, nullptr);
  sigaction(SIGTSTP, &sa, nullptr);
  sigaction(SIGCONT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
  sigaction(SIGHUP, &sa, nullptr);

  // a clipboard helper that exits early must not kill the editor
  struct sigaction ign{};
  ign.sa_handler = SIG_IGN;
  sigemptyset(&ign.sa_mask);
  sigaction(SIGPIPE, &ign, nullptr);
}

PendingSignals take_pending_signals() {
  PendingSignals p;
  p.resize = g_resize != 0; g_resize = 0;
  p.suspend = g_suspend != 0; g_suspend = 0;
  p.resumed = g_resumed != 0; g_resumed = 0;
  p.terminate = g_terminate != 0; g_terminate = 0;
  return p;
}
