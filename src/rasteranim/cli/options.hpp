#pragma once
#include "rasteranim/core/Config.hpp"

/* Build a pipeline configuration from "--key=value" arguments.
   Keys:
     --input=DIR  --output=DIR  --gif=FILE  --nodata=V  --duration=MS
     --loop=N  --ext=tif,tiff  --recursive  --stretch=minmax|percentile
     --plow=1  --phigh=98  --bar=20  --no-caption  --no-percent
     --manifest=FILE
   The extension default depends on the stage: tif,tiff for Convert/Full,
   png for Animate. Throws rasteranim::ConfigError on malformed values;
   required fields are checked later by validateConfig(). */
rasteranim::PipelineConfig configFromArgs(int argc, char** argv, rasteranim::Stage stage);

/* Print the option list shared by all modes. */
void print_options();
