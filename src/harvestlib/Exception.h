#ifndef EXCEPTION_H
#define EXCEPTION_H

#include <stdexcept>
#include <string>

/// This represents a tile harvest runtime error
class Exception : public std::runtime_error
{
public:
  Exception(const std::string& message):
      std::runtime_error(message)
  {
  }
};

/// Invalid bounding box, zoom range or other settings. Raised before any file or network activity.
class ConfigurationError : public Exception
{
public:
  ConfigurationError(const std::string& message):
      Exception(message)
  {
  }
};


#endif // EXCEPTION_H
