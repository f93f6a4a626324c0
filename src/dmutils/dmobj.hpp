//
//  Copyright (c) 2013-2015 plan44.ch / Lukas Zeller, Zurich, Switzerland
//
//  Author: Lukas Zeller <luz@plan44.ch>
//
//  This file is part of dalimaster.
//
//  dalimaster is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  dalimaster is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with dalimaster. If not, see <http://www.gnu.org/licenses/>.
//

#ifndef __dalimaster__dmobj__
#define __dalimaster__dmobj__

#include <boost/intrusive_ptr.hpp>

namespace dalimaster {

  class DMObj;

  void intrusive_ptr_add_ref(DMObj* o);
  void intrusive_ptr_release(DMObj* o);

  /// base class for all intrusively reference counted objects
  class DMObj {
    friend void intrusive_ptr_add_ref(DMObj* o);
    friend void intrusive_ptr_release(DMObj* o);

    int refCount;

  protected:
    DMObj() : refCount(0) {};
    virtual ~DMObj() {}; // needed for multiple inheritance
  };

  typedef boost::intrusive_ptr<DMObj> DMObjPtr;

} // namespace dalimaster


#endif /* defined(__dalimaster__dmobj__) */
