#pragma once
/*
 * Signals
 *
 * Purpose: turn SIGWINCH/SIGTSTP/SIGCONT/SIGTERM/SIGHUP into flags the event
 *          loop drains after its blocking read returns.
 * Constraint: handlers only store to sig_atomic_t; no terminal or buffer work.
 */

struct PendingSignals {
  bool resize = false;
  bool suspend = false;
  bool resumed = false;
  bool terminate = false;

  bool any() const { return resize || suspend || resumed || terminate; }
};

void install_signal_handlers();
PendingSignals take_pending_signals();
