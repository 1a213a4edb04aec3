#ifndef INCLUDE_SAFEEXEC_LOGGER_H_
#define INCLUDE_SAFEEXEC_LOGGER_H_

// Keep the console sink usable in children forked while another thread is logging.
void InitLogger();

#endif  // INCLUDE_SAFEEXEC_LOGGER_H_
