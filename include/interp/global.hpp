#ifndef INTERP_GLOBAL_HPP
#define INTERP_GLOBAL_HPP

/*!\file interp/global.hpp
 * \brief File for managing external headers.
 */

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#endif /* INTERP_GLOBAL_HPP */
