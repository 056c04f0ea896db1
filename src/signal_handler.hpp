#pragma once

void setup_signal_handlers();

// True once SIGINT or SIGTERM has been received.
bool stop_requested();
