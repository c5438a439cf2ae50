#include "stop_token.h"

#include <string.h>

static StopToken* signalToken = nullptr;

static void handleStopSignal(int) {
  if (signalToken) signalToken->requestStop();
}

bool installStopSignals(StopToken& token) {
  signalToken = &token;

  struct sigaction sa;
  memset(&sa, 0, sizeof(sa));
  sa.sa_handler = handleStopSignal;
  sigemptyset(&sa.sa_mask);
  // no SA_RESTART: nanosleep returns early with EINTR

  if (sigaction(SIGTERM, &sa, nullptr) != 0) return false;
  if (sigaction(SIGINT, &sa, nullptr) != 0) return false;
  return true;
}
