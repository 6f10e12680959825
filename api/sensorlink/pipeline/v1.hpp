#pragma once

#include "sensorlink/pipeline/v1/chunk.pb.h"
#include "sensorlink/pipeline/v1/control.pb.h"
#include "sensorlink/pipeline/v1/ingest.pb.h"
#include "sensorlink/pipeline/v1/snapshot.pb.h"

#include "sensorlink/pipeline/v1/control.grpc.pb.h"
#include "sensorlink/pipeline/v1/ingest.grpc.pb.h"
#include "sensorlink/pipeline/v1/snapshot.grpc.pb.h"
