#pragma once

#ifndef UCON_NUMBER_OF_PROCESSES
#define UCON_NUMBER_OF_PROCESSES 4
#endif

#ifndef UCON_CONSOLE_DRIVER_NUM
#define UCON_CONSOLE_DRIVER_NUM 0
#endif

// size of each of the two static console buffers (tx and rx)
#ifndef UCON_CONSOLE_BUFFER_SIZE
#define UCON_CONSOLE_BUFFER_SIZE 64
#endif
