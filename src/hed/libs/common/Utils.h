// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_UTILS_H__
#define __FAKEIDP_UTILS_H__

#include <cstddef>

namespace FakeIdP {

  /** \addtogroup common
   *  @{ */

  /// Scoped owner of a C structure released by its library's free function.
  /**
     @code
  AutoPointer<EVP_MD_CTX> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) return false;
  EVP_DigestInit_ex(ctx.Ptr(), md, NULL);
     @endcode
   */
  template<typename T>
  class AutoPointer {
  public:
    AutoPointer(T *o, void (*d)(T*))
      : object(o), deleter(d) {}
    ~AutoPointer(void) {
      if (object) (*deleter)(object);
    }
    bool operator!(void) const {
      return (object == NULL);
    }
    T* operator->(void) const {
      return object;
    }
    T* Ptr(void) const {
      return object;
    }
    /// Gives up ownership, for objects adopted by another structure.
    T* Release(void) {
      T *tmp = object;
      object = NULL;
      return tmp;
    }
  private:
    T *object;
    void (*deleter)(T*);
    AutoPointer(const AutoPointer<T>&);
    AutoPointer<T>& operator=(const AutoPointer<T>&);
  };

  /** @} */

} // namespace FakeIdP

#endif // __FAKEIDP_UTILS_H__
