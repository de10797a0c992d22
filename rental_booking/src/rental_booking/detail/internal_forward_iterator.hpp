/*
 * Copyright (C) 2021 Open Source Robotics Foundation
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
*/

#ifndef SRC__RENTAL_BOOKING__DETAIL__INTERNAL_FORWARD_ITERATOR_HPP
#define SRC__RENTAL_BOOKING__DETAIL__INTERNAL_FORWARD_ITERATOR_HPP

#include <rental_booking/detail/forward_iterator.hpp>

#include <utility>

namespace rental_booking {
namespace detail {

// The ImplementationType must provide:
//   ElementType& dereference() const;
//   void increment();
//   bool equals(const ImplementationType& other) const;

//==============================================================================
template<typename E, typename I, typename F>
E& forward_iterator<E, I, F>::operator*() const
{
  return _pimpl->dereference();
}

//==============================================================================
template<typename E, typename I, typename F>
E* forward_iterator<E, I, F>::operator->() const
{
  return &_pimpl->dereference();
}

//==============================================================================
template<typename E, typename I, typename F>
auto forward_iterator<E, I, F>::operator++() -> forward_iterator&
{
  _pimpl->increment();
  return *this;
}

//==============================================================================
template<typename E, typename I, typename F>
auto forward_iterator<E, I, F>::operator++(int) -> forward_iterator
{
  forward_iterator original(*this);
  ++(*this);
  return original;
}

//==============================================================================
template<typename E, typename I, typename F>
bool forward_iterator<E, I, F>::operator==(const forward_iterator& other) const
{
  return _pimpl->equals(*other._pimpl);
}

//==============================================================================
template<typename E, typename I, typename F>
bool forward_iterator<E, I, F>::operator!=(const forward_iterator& other) const
{
  return !(*this == other);
}

//==============================================================================
template<typename E, typename I, typename F>
forward_iterator<E, I, F>::forward_iterator()
{
  // Do nothing
}

//==============================================================================
template<typename E, typename I, typename F>
forward_iterator<E, I, F>::forward_iterator(I impl)
: _pimpl(rmf_utils::make_impl<I>(std::move(impl)))
{
  // Do nothing
}

} // namespace detail
} // namespace rental_booking

#endif // SRC__RENTAL_BOOKING__DETAIL__INTERNAL_FORWARD_ITERATOR_HPP
