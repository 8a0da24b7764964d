/*
    Great Circle utility functions

    Copyright (C) 2002 Robert Lipe, robertlipe+source@gpsbabel.org

    This program is free software; you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation; either version 2 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program; if not, write to the Free Software
    Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.

 */

#include "grtcirc.h"

#include <algorithm>  // for clamp
#include <cmath>      // for cos, sin, fabs, sqrt, asin, atan, isnan
#include <numbers>    // for pi
#include <tuple>      // for tuple, make_tuple

#include "defs.h"     // for PositionRad, kEarthRadiusMeters

static std::tuple<double, double, double>
crossproduct(double x1, double y1, double z1, double x2, double y2, double z2)
{
  double x = y1 * z2 - y2 * z1;
  double y = z1 * x2 - z2 * x1;
  double z = x1 * y2 - y1 * x2;
  return std::make_tuple(x, y, z);
}

static double dotproduct(double x1, double y1, double z1,
                         double x2, double y2, double z2)
{
  return (x1 * x2 + y1 * y2 + z1 * z2);
}

double radtometers(double rads)
{
  return (rads * kEarthRadiusMeters);
}

/* Haversine form, well conditioned for the short hops between
 * consecutive track points.  Result is in radians.
 */
double gcdist(PositionRad pos1, PositionRad pos2)
{
  const double lat1 = pos1.latR;
  const double lon1 = pos1.lonR;
  const double lat2 = pos2.latR;
  const double lon2 = pos2.lonR;

  double sdlat = sin((lat1 - lat2) / 2.0);
  double sdlon = sin((lon1 - lon2) / 2.0);

  double res = sqrt(sdlat * sdlat + cos(lat1) * cos(lat2) * sdlon * sdlon);

  res = std::clamp(res, -1.0, 1.0);

  res = asin(res);

  if (std::isnan(res)) { /* this should never happen */
    return 0;
  }

  return 2.0 * res;
}

/*
 * Distance, in radians, from point 3 to the great circle segment
 * joining points 1 and 2.  If the foot of the perpendicular falls
 * outside the segment the distance to the nearer endpoint is used.
 */
double linedist(PositionRad pos1, PositionRad pos2, PositionRad pos3)
{
  const double lat1 = pos1.latR;
  const double lon1 = pos1.lonR;
  const double lat2 = pos2.latR;
  const double lon2 = pos2.lonR;
  const double lat3 = pos3.latR;
  const double lon3 = pos3.lonR;

  /* polar to ECEF rectangular */
  double x1 = cos(lon1) * cos(lat1);
  double y1 = sin(lat1);
  double z1 = sin(lon1) * cos(lat1);
  double x2 = cos(lon2) * cos(lat2);
  double y2 = sin(lat2);
  double z2 = sin(lon2) * cos(lat2);
  double x3 = cos(lon3) * cos(lat3);
  double y3 = sin(lat3);
  double z3 = sin(lon3) * cos(lat3);

  /* 'a' is the axis; the line that passes through the center of the earth
   * and is perpendicular to the great circle through point 1 and point 2
   * It is computed by taking the cross product of the '1' and '2' vectors.*/
  auto [xa, ya, za] = crossproduct(x1, y1, z1, x2, y2, z2);
  double la = sqrt(xa * xa + ya * ya + za * za);

  if (la == 0) {
    /* la is 0 when 1 and 2 are either the same point or 180 degrees apart */
    double dot = dotproduct(x1, y1, z1, x2, y2, z2);
    if (dot >= 0) {
      return gcdist(pos1, pos3);
    } else {
      return 0;
    }
  }

  xa /= la;
  ya /= la;
  za /= la;

  /* dot is the component of the length of '3' that is along the axis.
   * What's left is a non-normalized vector that lies in the plane of
   * 1 and 2. */
  double dot = dotproduct(x3, y3, z3, xa, ya, za);

  double xp = x3 - dot * xa;
  double yp = y3 - dot * ya;
  double zp = z3 - dot * za;

  double lp = sqrt(xp * xp + yp * yp + zp * zp);

  if (lp == 0) {
    /* lp is 0 when 3 is 90 degrees from the great circle */
    return std::numbers::pi / 2;
  }

  /* After this, 'p' is normalized */
  xp /= lp;
  yp /= lp;
  zp /= lp;

  auto [xa1, ya1, za1] = crossproduct(x1, y1, z1, xp, yp, zp);
  double d1 = dotproduct(xa1, ya1, za1, xa, ya, za);

  auto [xa2, ya2, za2] = crossproduct(xp, yp, zp, x2, y2, z2);
  double d2 = dotproduct(xa2, ya2, za2, xa, ya, za);

  if (d1 >= 0 && d2 >= 0) {
    /* The angle is the arctangent of the component of vector 3 along
     * the axis over the component of vector 3 in the plane, both of
     * which are already known to be positive. */
    return atan(fabs(dot) / lp);
  }

  /* otherwise, get the distance from the closest endpoint */
  double c1 = dotproduct(x1, y1, z1, xp, yp, zp);
  double c2 = dotproduct(x2, y2, z2, xp, yp, zp);
  d1 = fabs(d1);
  d2 = fabs(d2);

  /* d$n$ is proportional to the sine of the angle between point $n$
   * and point p, c$n$ to its cosine.  Past 90 degrees c$n$ goes
   * negative, so flop the sine across the y=1 axis to keep the
   * ordering.  This only works on the unit sphere. */
  if (c1 < 0) {
    d1 = 2 - d1;
  }
  if (c2 < 0) {
    d2 = 2 - d2;
  }

  if (d1 < d2) {
    return gcdist(pos1, pos3);
  } else {
    return gcdist(pos2, pos3);
  }
}
