#ifndef INCLUDE_DATAJAIL_LOGGER_H_
#define INCLUDE_DATAJAIL_LOGGER_H_

// Keep the console sink usable in children created by fork()
void InitLogger();

#endif  // INCLUDE_DATAJAIL_LOGGER_H_
