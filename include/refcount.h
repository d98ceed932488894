#if !defined(REFCOUNT_H)
#define REFCOUNT_H
/*
 * Reference counting with delete on last release.
 *
 * Compiled patterns, engines and subjects are immutable after construction
 * and are shared between matchers and match snapshots using these.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<atomic>

class	RefCounted
{
public:
	virtual		~RefCounted() { }
			RefCounted() : ref_count(0) {}
	void		AddRef() const { (void)ref_count++; }
	void		Release() const { if (--ref_count == 0) delete this; }

private:
	mutable std::atomic<int> ref_count;

	RefCounted(const RefCounted&);		// Never copy a counted object
	RefCounted&	operator=(const RefCounted&);
};

template <class T>
class Ref
{
	std::atomic<T*>	ptr;

public:
			~Ref() { T* o = ptr; if (o) o->Release(); }
			Ref() : ptr(0) {}
			Ref(T* o) { if (o) o->AddRef(); ptr = o; }
			Ref(const Ref& other) { T* o = other; if (o) o->AddRef(); ptr = o; }
	template <class S>
			Ref(const Ref<S>& other) { T* o = (S*)other; if (o) o->AddRef(); ptr = o; }
	Ref&		operator=(const Ref& other)
			{
				T*      o = other;
				if (o)
					o->AddRef();
				o = (T*)ptr.exchange(o);
				if (o)
					o->Release();
				return *this;
			}
	Ref&		operator=(T* other)
			{
				if (other)
					other->AddRef();

				T*      o = (T*)ptr.exchange(other);
				if (o)
					o->Release();
				return *this;
			}

			operator T*() const { return ptr; }
	T*		operator->() const { return ptr; }
	T&		operator*() const { return *ptr; }
};
#endif
