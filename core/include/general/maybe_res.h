// Copyright (C) 2022 Check Point Software Technologies Ltd. All rights reserved.

// Licensed under the Apache License, Version 2.0 (the "License");
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef __MAYBE_RES_H__
#define __MAYBE_RES_H__

#include <new>
#include <string>
#include <ostream>
#include <sstream>
#include <utility>

#include "common.h"
#include "debug.h"

template <typename Err>
class Error
{
    template <typename T, typename TErr>
    friend class Maybe;

public:
    template<typename... Args>
    Error(Args&&... args) : err(std::forward<Args>(args)...) {}

    bool
    operator==(const Error &other) const
    {
        return err == other.err;
    }

private:
    Err err;
};

template <>
class Error<void>
{
    template <typename T, typename TErr>
    friend class Maybe;

public:
    template<typename... Args> Error(Args&&...) {}

    bool operator==(const Error &) const { return true; }
};

// Wrapper templated functions, useful for creating Error class since the templating matching for them is better
template <typename Err, typename... Args>
Error<Err>
genError(Args&&... args)
{
    return Error<Err>(std::forward<Args>(args)...);
}

template <typename Err>
Error<Err>
genError(Err err)
{
    return Error<Err>(std::forward<Err>(err));
}

inline Error<std::string>
genError(const char *err)
{
    return Error<std::string>(err);
}

template <typename T, typename TErr = std::string>
class Maybe
{
public:
    Maybe(const Error<TErr> &_err)     : set(false), err(_err) {}
    Maybe(Error<TErr> &&_err)          : set(false), err(std::move(_err)) {}
    Maybe(const T &_val)               : set(true), val(_val) {}
    Maybe(T &&_val)                    : set(true), val(std::move(_val)) {}

    // Constructors from another error class (which is convertible to TErr)
    template<typename OTErr>
    Maybe(const Error<OTErr> &_err)    : set(false), err(_err.err) {}
    template<typename OTErr>
    Maybe(Error<OTErr> &&_err)         : set(false), err(std::move(_err.err)) {}

    Maybe(const Maybe &m);
    Maybe(Maybe &&m);
    ~Maybe();

    bool operator==(const Maybe &other) const;
    bool operator!=(const Maybe &other) const { return !(*this==other); }

    Maybe & operator=(const Maybe &other);
    Maybe & operator=(Maybe &&other);

    // ok         - do we have a value (true) or error (false)?
    // unpack     - get the inner value, asserts when holding an error.
    // getErr     - get the error, asserts when holding a value.
    // passErr    - get the wrapper for the error, for forwarding it into a Maybe of another type.
    // unpackMove - get an R-value reference to the inner value.
    bool                ok()         const { return set; }
    const T &           unpack()     const;
    const T &           operator*()  const { return unpack(); }
    const T *           operator->() const { return &unpack(); }
    T       &&          unpackMove();
    TErr                getErr()     const;
    const Error<TErr> & passErr()    const;

    // Throw `Exp`, constructed from the streamed `args` followed by the error, when holding an error.
    template <class Exp, typename... Args>
    void verify(Args... args) const;
    template <class Exp, typename... Args>
    const T & unpack(Args... args) const;

    std::ostream & print(std::ostream &os) const;

private:
    void destroy();

    bool set;
    union {
        T val;
        Error<TErr> err;
    };
};

template <typename TErr>
class Maybe<void, TErr>
{
    class Nothing
    {
    public:
        bool operator==(const Nothing &) const { return true; }
    };

public:
    Maybe()                            : maybe(Nothing()) {}

    Maybe(const Error<TErr> &_err)     : maybe(_err) {}
    Maybe(Error<TErr> &&_err)          : maybe(std::move(_err)) {}

    template<typename OTErr>
    Maybe(const Error<OTErr> &_err)    : maybe(_err) {}
    template<typename OTErr>
    Maybe(Error<OTErr> &&_err)         : maybe(std::move(_err)) {}

    bool operator==(const Maybe &other) const { return maybe == other.maybe; }
    bool operator!=(const Maybe &other) const { return !(*this==other); }

    bool                ok()      const { return maybe.ok();      }
    TErr                getErr()  const { return maybe.getErr();  }
    const Error<TErr> & passErr() const { return maybe.passErr(); }

    template <class Exp, typename... Args>
    void verify(Args... args) const { maybe.template verify<Exp>(args...); }

    std::ostream &
    print(std::ostream &os) const
    {
        if (ok()) return os << "Value()";
        return os << "Error(" << getErr() << ")";
    }

private:
    Maybe<Nothing, TErr> maybe;
};

//
// Method Implementations
//

namespace MaybeDetails
{

inline void streamAll(std::ostream &) {}

template <typename First, typename... Rest>
void
streamAll(std::ostream &os, const First &first, const Rest &... rest)
{
    os << first;
    streamAll(os, rest...);
}

} // namespace MaybeDetails

template <typename T, typename TErr>
Maybe<T, TErr>::Maybe(const Maybe<T, TErr> &m)
        :
    set(m.set)
{
    if (set) {
        new (&val) T(m.val);
    } else {
        new (&err) Error<TErr>(m.err);
    }
}

template <typename T, typename TErr>
Maybe<T, TErr>::Maybe(Maybe<T, TErr> &&m)
        :
    set(m.set)
{
    if (set) {
        new (&val) T(std::move(m.val));
    } else {
        new (&err) Error<TErr>(std::move(m.err));
    }
}

template <typename T, typename TErr>
Maybe<T, TErr>::~Maybe()
{
    destroy();
}

template <typename T, typename TErr>
void
Maybe<T, TErr>::destroy()
{
    if (set) {
        val.~T();
    } else {
        err.~Error<TErr>();
    }
}

template <typename T, typename TErr>
bool
Maybe<T, TErr>::operator==(const Maybe<T, TErr> &other) const
{
    if (set != other.set) return false;
    if (set) return val == other.val;
    return err == other.err;
}

template <typename T, typename TErr>
Maybe<T, TErr> &
Maybe<T, TErr>::operator=(const Maybe<T, TErr> &other)
{
    if (this == &other) return *this;
    destroy();
    set = other.set;
    if (set) {
        new (&val) T(other.val);
    } else {
        new (&err) Error<TErr>(other.err);
    }
    return *this;
}

template <typename T, typename TErr>
Maybe<T, TErr> &
Maybe<T, TErr>::operator=(Maybe<T, TErr> &&other)
{
    if (this == &other) return *this;
    destroy();
    set = other.set;
    if (set) {
        new (&val) T(std::move(other.val));
    } else {
        new (&err) Error<TErr>(std::move(other.err));
    }
    return *this;
}

template <typename T, typename TErr>
const T &
Maybe<T, TErr>::unpack() const
{
    dbgAssert(set) << "Maybe value is not set";
    return val;
}

template <typename T, typename TErr>
T &&
Maybe<T, TErr>::unpackMove()
{
    dbgAssert(set) << "No value to be moved";
    return std::move(val);
}

template <typename T, typename TErr>
TErr
Maybe<T, TErr>::getErr() const
{
    dbgAssert(!set) << "Maybe value is set";
    return err.err;
}

template <typename T, typename TErr>
const Error<TErr> &
Maybe<T, TErr>::passErr() const
{
    dbgAssert(!set) << "Maybe value is set";
    return err;
}

template <typename T, typename TErr>
template <class Exp, typename... Args>
void
Maybe<T, TErr>::verify(Args... args) const
{
    if (set) return;
    std::ostringstream os;
    MaybeDetails::streamAll(os, args..., err.err);
    throw Exp(os.str());
}

template <typename T, typename TErr>
template <class Exp, typename... Args>
const T &
Maybe<T, TErr>::unpack(Args... args) const
{
    verify<Exp>(args...);
    return val;
}

template <typename T, typename TErr>
std::ostream &
Maybe<T, TErr>::print(std::ostream &os) const
{
    if (ok()) return os << "Value(" << unpack() << ")";
    return os << "Error(" << getErr() << ")";
}

// Formatting operator. Prints either the value or the error.
template <typename T, typename TErr>
std::ostream &
operator<<(std::ostream &os, const Maybe<T, TErr> &maybe)
{
    return maybe.print(os);
}

#endif // __MAYBE_RES_H__
