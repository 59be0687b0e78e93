#include <qbatch/QBatchUsage.hh>

QBatchUsage::QBatchUsage(std::string const& msg) :
    std::runtime_error(msg)
{
}
