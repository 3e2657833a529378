#include "interp/pool.hpp"

PoolObj::PoolObj(Pool &pool) {
  pool.add(this);
}

// Pool

Pool::~Pool() {
  clear();
}

void Pool::add(PoolObj *obj) {
  objs.push_back(obj);
  ++countAllocated;
}

void Pool::clear() noexcept {
  for (PoolObj *obj : objs)
    delete obj;

  objs.clear();
}
