#pragma once

/* Entry points for CLI modes.
   Each function parses argv options and runs the selected mode.
   Return value: 0 on success, 1 on a failed run, 2 on bad options. */

/* Convert rasters to previews, then build the animation.
   Example:
     rasteranim-cli run --input=tif --output=png --gif=out.gif --nodata=0 */
int run_full   (int argc, char** argv);

/* Convert rasters to PNG previews only.
   Example:
     rasteranim-cli convert --input=tif --output=png --stretch=percentile */
int run_convert(int argc, char** argv);

/* Build an animation from a folder of PNG files (sorted by name).
   Example:
     rasteranim-cli animate --input=png --gif=out.gif --duration=500 */
int run_animate(int argc, char** argv);
