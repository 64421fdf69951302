#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace stemsep
{

// invalid combination of targets or separator options
class ConfigurationError : public std::invalid_argument
{
  public:
    explicit ConfigurationError(const std::string &what)
        : std::invalid_argument(what)
    {
    }
};

// tensors that must agree on an axis do not
class ShapeError : public std::runtime_error
{
  public:
    explicit ShapeError(const std::string &what) : std::runtime_error(what) {}
};

class ModelNotFoundError : public std::runtime_error
{
  public:
    enum Kind
    {
        // the given local directory or weight file does not exist
        LocalPath,
        // the name is neither a path nor a known pretrained model
        UnknownRegistryName,
        // known pretrained model that is not present in the cache
        Unavailable
    };

    ModelNotFoundError(Kind kind, const std::string &what)
        : std::runtime_error(what), kind_(kind)
    {
    }

    Kind kind() const { return kind_; }

  private:
    Kind kind_;
};

} // namespace stemsep

#endif // ERRORS_HPP
