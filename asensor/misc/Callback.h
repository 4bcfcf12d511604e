/*
 * Copyright (c) 2015 Ambroz Bizjak
 * Copyright (c) 2026 The asensor Authors
 * All rights reserved.
 * 
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 * 1. Redistributions of source code must retain the above copyright
 *    notice, this list of conditions and the following disclaimer.
 * 2. Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 * 
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND
 * ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR ANY
 * DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef ASENSOR_CALLBACK_H
#define ASENSOR_CALLBACK_H

namespace ASensor {

template <typename>
class Callback;

/**
 * A function pointer bound to an opaque argument, typically an object
 * whose member function is to be called.
 *
 * Use @ref ASENSOR_CB_OBJFUNC to make a callback for a member function.
 */
template <typename R, typename... Args>
class Callback<R(Args...)> {
public:
    R operator() (Args... args) const
    {
        return m_func(m_arg, args...);
    }

    explicit operator bool () const
    {
        return m_func != nullptr;
    }

public:
    R (*m_func) (void *, Args... args);
    void *m_arg;
};

namespace CallbackPrivate {
    template <typename Obj, typename R, typename... Args>
    struct MakeObj {
        template <R (Obj::*Func) (Args...)>
        struct WithFunc {
            static Callback<R(Args...)> MakeCallback (Obj *obj)
            {
                return Callback<R(Args...)>{WithFunc::callback_func, obj};
            }

            static R callback_func (void *obj, Args... args)
            {
                Obj *o = static_cast<Obj *>(obj);
                return (o->*Func)(args...);
            }
        };
    };

    template <typename Obj, typename R, typename... Args>
    MakeObj<Obj, R, Args...> MakeObjHelper (R (Obj::*func) (Args...));
}

#define ASENSOR_CB_OBJFUNC(func, obj) (decltype(ASensor::CallbackPrivate::MakeObjHelper(func))::WithFunc<func>::MakeCallback(obj))
#define ASENSOR_CB_OBJFUNC_T(func, obj) (decltype(ASensor::CallbackPrivate::MakeObjHelper(func))::template WithFunc<func>::MakeCallback(obj))

}

#endif
