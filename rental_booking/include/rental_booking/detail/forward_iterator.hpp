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

#ifndef RENTAL_BOOKING__DETAIL__FORWARD_ITERATOR_HPP
#define RENTAL_BOOKING__DETAIL__FORWARD_ITERATOR_HPP

#include <rmf_utils/impl_ptr.hpp>

#include <cstddef>
#include <iterator>
#include <type_traits>

namespace rental_booking {
namespace detail {

//==============================================================================
/// A single-pass iterator whose state is hidden behind an implementation
/// pointer. Only `Friend` can construct a non-end iterator.
template<typename ElementType, typename ImplementationType, typename Friend>
class forward_iterator
{
public:

  using Element = ElementType;
  using Implementation = ImplementationType;

  using iterator_category = std::input_iterator_tag;
  using value_type = std::remove_const_t<ElementType>;
  using difference_type = std::ptrdiff_t;
  using pointer = ElementType*;
  using reference = ElementType&;

  /// Dereference operator
  ElementType& operator*() const;

  /// Drill-down operator
  ElementType* operator->() const;

  /// Pre-increment operator: ++it
  ///
  /// \note This is more efficient than the post-increment operator.
  forward_iterator& operator++();

  /// Post-increment operator: it++
  forward_iterator operator++(int);

  /// Equality comparison operator
  bool operator==(const forward_iterator& other) const;

  /// Inequality comparison operator
  bool operator!=(const forward_iterator& other) const;

  // Allow regular copying and moving
  forward_iterator(const forward_iterator&) = default;
  forward_iterator(forward_iterator&&) = default;
  forward_iterator& operator=(const forward_iterator&) = default;
  forward_iterator& operator=(forward_iterator&&) = default;

  // Default constructor. This will leave the iterator uninitialized, so it is
  // UNDEFINED BEHAVIOR to use it before assigning an iterator that was
  // obtained from a view.
  forward_iterator();

private:
  forward_iterator(ImplementationType impl);
  friend Friend;
  rmf_utils::impl_ptr<ImplementationType> _pimpl;
};

} // namespace detail
} // namespace rental_booking

#endif // RENTAL_BOOKING__DETAIL__FORWARD_ITERATOR_HPP
