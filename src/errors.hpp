#pragma once
#include <stdexcept>

namespace quasar
{

  struct GraphError : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  // a relationship endpoint does not exist
  struct ReferenceError : GraphError
  {
    using GraphError::GraphError;
  };

  struct NotFoundError : GraphError
  {
    using GraphError::GraphError;
  };

  // malformed condition, pattern, direction token, id or attribute key
  struct ValidationError : GraphError
  {
    using GraphError::GraphError;
  };

  // backing file unreadable, unwritable or not a graph document
  struct PersistenceError : GraphError
  {
    using GraphError::GraphError;
  };

} // namespace quasar
