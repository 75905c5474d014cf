#pragma once

// Names bound implicitly by scopes that the source never declares. The
// resolver and the evaluator open these scopes at the same points:
//   block             -> one scope for its statements
//   function call     -> one scope holding the parameters and the body
//   class with super  -> one scope holding SUPER_NAME around the methods
//   bound method      -> one scope holding THIS_NAME around the method closure
inline constexpr const char* THIS_NAME = "this";
inline constexpr const char* SUPER_NAME = "super";
inline constexpr const char* INITIALIZER_NAME = "init";
