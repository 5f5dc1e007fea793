#ifndef toastlibs_tests_testing_hpp_included_
#define toastlibs_tests_testing_hpp_included_

#include <boost/noncopyable.hpp>
#include <boost/filesystem.hpp>

#include "../toast/image.hpp"
#include "../toast/sampler.hpp"

namespace toastlibs { namespace testing {

/** Temporary directory removed on scope exit.
 */
class TemporaryDirectory : boost::noncopyable {
public:
    TemporaryDirectory()
        : path_(boost::filesystem::temp_directory_path()
                / boost::filesystem::unique_path("toastlibs-%%%%-%%%%-%%%%"))
    {
        boost::filesystem::create_directories(path_);
    }

    ~TemporaryDirectory() {
        boost::system::error_code ec;
        boost::filesystem::remove_all(path_, ec);
    }

    const boost::filesystem::path& path() const { return path_; }

private:
    boost::filesystem::path path_;
};

/** f32 image filled with given value.
 */
inline toast::TileImage constantImage(float value, int size = 256)
{
    return toast::TileImage(toast::ImageMode::f32
                            , cv::Mat(size, size, CV_32FC1
                                      , cv::Scalar(value)));
}

/** Sampler returning given constant everywhere.
 */
inline toast::Sampler::pointer constantSampler(double value)
{
    return std::make_shared<toast::FunctionSampler>
        ([value](double, double) { return value; });
}

} } // namespace toastlibs::testing

#endif // toastlibs_tests_testing_hpp_included_
