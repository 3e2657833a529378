#ifndef INTERP_POOL_HPP
#define INTERP_POOL_HPP

/*!\file interp/pool.hpp
 * \brief Ownership of syntax nodes of a statement.
 */

#include "interp/global.hpp"

class PoolObj;
class Pool;

/*!\brief Object owned by a Pool (objects to release).
 */
class PoolObj {
public:
  //!\brief Registers itself in pool.
  PoolObj(Pool &pool);

  virtual ~PoolObj() {}
};

/*!\brief Owns every object created with it, until clear() is called.
 */
class Pool {
  std::size_t countAllocated;

  //! All objects available.
  std::vector<PoolObj*> objs;
public:
  Pool() : countAllocated{0}, objs() {}
  Pool(const Pool &) = delete;
  Pool &operator=(const Pool &) = delete;
  virtual ~Pool();

  /*!\return Returns count of objects currently owned.
   */
  std::size_t size() const noexcept { return objs.size(); }

  /*!\return Returns count of objects ever added.
   */
  std::size_t getCountAllocated() const noexcept { return countAllocated; }

  /*!\brief Adds obj to all objects available.
   * \param obj
   */
  void add(PoolObj *obj);

  /*!\brief Deletes all objects.
   *
   * Pointers to objects of this pool are dangling afterwards.
   */
  void clear() noexcept;
};

#endif /* INTERP_POOL_HPP */
