#pragma once

#include <string>
#include "sample_info.pb.h"
namespace hostwatch
{
    /// 监控接口类，每个实现负责样本中的一个维度
    class Monitor{
        public:
            Monitor(){}
            virtual ~Monitor(){}
            // 采集一次并写入 sample_info，采集失败返回 false
            virtual bool update(hostwatch::proto::SampleInfo *sample_info) = 0;
            // 采集失败时写入约定的默认值，保证样本字段完整
            virtual void apply_default(hostwatch::proto::SampleInfo *sample_info) = 0;
            // 监控器名称，用于日志
            virtual std::string name() const = 0;
    };
    
} // namespace hostwatch
